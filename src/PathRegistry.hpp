#ifndef PATH_REGISTRY_HPP
#define PATH_REGISTRY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Ordered prefixes; each entry is both the filename prefix and the destination folder name.
using PrefixSet = std::vector<std::string>;

// Loads filePaths.json and keeps the destination folders in place.
class PathRegistry {
public:
    explicit PathRegistry(std::filesystem::path rootDir);

    // Write the placeholder prefix list when the file does not exist yet.
    bool bootstrapIfAbsent() const;
    // Bootstrap if needed, then read the prefix list; nullopt unless it is a JSON array of strings.
    std::optional<PrefixSet> load() const;
    // Create every missing destination folder; returns false if any prefix could not be prepared.
    bool ensureDirectories(const PrefixSet& prefixes) const;
    // Folder that receives files matching the given prefix.
    std::filesystem::path destinationFor(const std::string& prefix) const;

    const std::filesystem::path& registryPath() const { return m_registryPath; }

    static constexpr const char* kFileName = "filePaths.json";

private:
    std::filesystem::path m_rootDir;
    std::filesystem::path m_registryPath;
};

#endif
