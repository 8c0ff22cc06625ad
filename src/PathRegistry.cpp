#include "PathRegistry.hpp"

#include "Outcome.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr int kJsonIndent = 4;
constexpr const char kPlaceholderPrefix[] = "empty";
} // namespace

PathRegistry::PathRegistry(std::filesystem::path rootDir)
    : m_rootDir(std::move(rootDir)), m_registryPath(m_rootDir / kFileName) {}

bool PathRegistry::bootstrapIfAbsent() const {
    std::error_code ec;
    if (std::filesystem::exists(m_registryPath, ec)) {
        return true;
    }

    if (ec) {
        logFailure(FailureKind::IO) << "Unable to check prefix list `" << m_registryPath.string() << "`: " << ec.message() << std::endl;
        return false;
    }

    std::ofstream out(m_registryPath, std::ios::trunc);
    if (!out) {
        logFailure(FailureKind::IO) << "Failed to create prefix list: " << m_registryPath << std::endl;
        return false;
    }

    out << json::array({kPlaceholderPrefix}).dump(kJsonIndent, ' ', false);
    out.flush();
    if (!out) {
        logFailure(FailureKind::IO) << "Failed to write prefix list: " << m_registryPath << std::endl;
        return false;
    }

    std::cout << "Prefix list `" << m_registryPath.string() << "` not found, created with a placeholder entry." << std::endl;
    return true;
}

std::optional<PrefixSet> PathRegistry::load() const {
    if (!bootstrapIfAbsent()) {
        return std::nullopt;
    }

    std::ifstream jsonFile(m_registryPath);
    if (!jsonFile) {
        logFailure(FailureKind::IO) << "Failed to open prefix list: " << m_registryPath << std::endl;
        return std::nullopt;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        logFailure(FailureKind::Registry) << "Failed to parse prefix list: " << e.what() << std::endl;
        return std::nullopt;
    }

    if (!data.is_array()) {
        logFailure(FailureKind::Registry) << "Invalid prefix list " << m_registryPath << ": expected an array of strings." << std::endl;
        return std::nullopt;
    }

    PrefixSet prefixes;
    prefixes.reserve(data.size());
    for (const auto& entry : data) {
        if (!entry.is_string()) {
            logFailure(FailureKind::Registry) << "Invalid prefix list " << m_registryPath << ": each entry must be a string." << std::endl;
            return std::nullopt;
        }

        std::string prefix = entry.get<std::string>();
        // An empty prefix would swallow every file in the watch folder.
        if (prefix.empty()) {
            logFailure(FailureKind::Registry) << "Invalid prefix list " << m_registryPath << ": prefixes cannot be empty." << std::endl;
            return std::nullopt;
        }
        prefixes.push_back(std::move(prefix));
    }

    std::cout << "Loaded " << prefixes.size() << " prefix(es) from " << m_registryPath << std::endl;
    return prefixes;
}

bool PathRegistry::ensureDirectories(const PrefixSet& prefixes) const {
    bool allReady = true;
    for (const auto& prefix : prefixes) {
        const auto destination = destinationFor(prefix);

        std::error_code ec;
        if (std::filesystem::is_directory(destination, ec)) {
            continue;
        }

        if (std::filesystem::exists(destination, ec)) {
            logFailure(FailureKind::IO) << "Cannot create destination `" << destination.string() << "`: a non-directory file is in the way." << std::endl;
            allReady = false;
            continue;
        }

        ec.clear();
        std::filesystem::create_directories(destination, ec);
        if (ec) {
            logFailure(FailureKind::IO) << "Failed to create destination directory `" << destination.string() << "`: " << ec.message() << std::endl;
            allReady = false;
            continue;
        }

        std::cout << "Created destination directory `" << destination.string() << "`" << std::endl;
    }

    return allReady;
}

std::filesystem::path PathRegistry::destinationFor(const std::string& prefix) const {
    return m_rootDir / prefix;
}
