#include "SettingsStore.hpp"

#include "Outcome.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>

namespace {
constexpr const char kSettingsSection[] = "settings";

std::string trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch);
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch);
    }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Only the literal "true" enables a flag; everything else reads as false.
bool parseFlag(const std::string& value) {
    return value == "true";
}
} // namespace

SettingsStore::SettingsStore(std::filesystem::path rootDir)
    : m_settingsPath(std::move(rootDir) / kFileName) {}

bool SettingsStore::bootstrapIfAbsent() const {
    std::error_code ec;
    if (std::filesystem::exists(m_settingsPath, ec)) {
        return true;
    }

    if (ec) {
        logFailure(FailureKind::IO) << "Unable to check settings file `" << m_settingsPath.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    std::cout << "Settings file `" << m_settingsPath.string() << "` not found, writing defaults." << std::endl;
    return save(Settings{});
}

bool SettingsStore::save(const Settings& settings) const {
    std::ofstream out(m_settingsPath, std::ios::trunc);
    if (!out) {
        logFailure(FailureKind::IO) << "Failed to open settings file for writing: " << m_settingsPath << std::endl;
        return false;
    }

    out << "[" << kSettingsSection << "]\n"
        << "isrunning = " << (settings.running ? "true" : "false") << "\n"
        << "gethashes = " << (settings.digestEnabled ? "true" : "false") << "\n"
        << "hashmethod = " << settings.digestAlgorithm << "\n"
        << "currentpathname = " << settings.watchDirectory << "\n\n";

    out.flush();
    if (!out) {
        logFailure(FailureKind::IO) << "Failed to write settings file: " << m_settingsPath << std::endl;
        return false;
    }
    return true;
}

std::optional<Settings> SettingsStore::load() const {
    if (!bootstrapIfAbsent()) {
        return std::nullopt;
    }

    std::ifstream in(m_settingsPath);
    if (!in) {
        logFailure(FailureKind::IO) << "Failed to open settings file: " << m_settingsPath << std::endl;
        return std::nullopt;
    }

    std::unordered_map<std::string, Section> sections;
    if (!parse(in, sections)) {
        return std::nullopt;
    }

    auto sectionIt = sections.find(kSettingsSection);
    if (sectionIt == sections.end()) {
        logFailure(FailureKind::Config) << "Settings file " << m_settingsPath << " has no [" << kSettingsSection << "] section." << std::endl;
        return std::nullopt;
    }

    const Section& section = sectionIt->second;
    auto running = requireKey(section, "isRunning");
    auto digestEnabled = requireKey(section, "getHashes");
    auto digestAlgorithm = requireKey(section, "hashMethod");
    auto watchDirectory = requireKey(section, "currentPathName");
    if (!running || !digestEnabled || !digestAlgorithm || !watchDirectory) {
        return std::nullopt;
    }

    if (watchDirectory->empty()) {
        logFailure(FailureKind::Config) << "Invalid settings: `currentPathName` cannot be empty." << std::endl;
        return std::nullopt;
    }

    Settings settings;
    settings.running = parseFlag(*running);
    settings.digestEnabled = parseFlag(*digestEnabled);
    settings.digestAlgorithm = *digestAlgorithm;
    settings.watchDirectory = *watchDirectory;
    return settings;
}

bool SettingsStore::parse(std::istream& in, std::unordered_map<std::string, Section>& sections) const {
    std::string line;
    std::size_t lineNumber = 0;
    Section* current = nullptr;

    while (std::getline(in, line)) {
        ++lineNumber;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#' || stripped.front() == ';') {
            continue;
        }

        if (stripped.front() == '[') {
            if (stripped.back() != ']' || stripped.size() < 3) {
                logFailure(FailureKind::Config) << "Malformed section header on line " << lineNumber << " of " << m_settingsPath << std::endl;
                return false;
            }
            current = &sections[trim(stripped.substr(1, stripped.size() - 2))];
            continue;
        }

        const auto delimiter = stripped.find_first_of("=:");
        if (delimiter == std::string::npos || delimiter == 0) {
            logFailure(FailureKind::Config) << "Malformed entry on line " << lineNumber << " of " << m_settingsPath << ": `" << stripped << "`" << std::endl;
            return false;
        }

        if (current == nullptr) {
            logFailure(FailureKind::Config) << "Entry on line " << lineNumber << " of " << m_settingsPath << " appears before any section header." << std::endl;
            return false;
        }

        // Option names are case-insensitive, values are kept verbatim.
        (*current)[toLower(trim(stripped.substr(0, delimiter)))] = trim(stripped.substr(delimiter + 1));
    }

    if (in.bad()) {
        logFailure(FailureKind::IO) << "Failed to read settings file: " << m_settingsPath << std::endl;
        return false;
    }
    return true;
}

std::optional<std::string> SettingsStore::requireKey(const Section& section, const std::string& key) const {
    auto it = section.find(toLower(key));
    if (it == section.end()) {
        logFailure(FailureKind::Config) << "Invalid settings: missing `" << key << "` in [" << kSettingsSection << "]." << std::endl;
        return std::nullopt;
    }
    return it->second;
}
