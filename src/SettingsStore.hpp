#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>

// Snapshot of the [settings] section, reloaded at the top of every polling cycle.
struct Settings {
    bool running = true;
    bool digestEnabled = true;
    // Raw hashMethod value; DigestEngine decides how to interpret it.
    std::string digestAlgorithm = "MD5";
    std::string watchDirectory = "Images";
};

// Reads and bootstraps config.ini in the root directory.
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path rootDir);

    // Write the default settings file when none exists; returns false on I/O errors.
    bool bootstrapIfAbsent() const;
    // Bootstrap if needed, then parse a fresh snapshot; nullopt when the file is malformed.
    std::optional<Settings> load() const;
    // Persist a snapshot in the same INI layout load() reads.
    bool save(const Settings& settings) const;

    const std::filesystem::path& settingsPath() const { return m_settingsPath; }

    static constexpr const char* kFileName = "config.ini";

private:
    using Section = std::unordered_map<std::string, std::string>;

    // Parse the INI text into sections; returns false on a line that is not valid INI.
    bool parse(std::istream& in, std::unordered_map<std::string, Section>& sections) const;
    // Fetch a required key, logging when it is missing.
    std::optional<std::string> requireKey(const Section& section, const std::string& key) const;

    std::filesystem::path m_settingsPath;
};

#endif
