#ifndef DIGEST_LEDGER_HPP
#define DIGEST_LEDGER_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>

// Accumulates "<destination> | <filename>" -> digest entries for the lifetime of the process
// and rewrites fileHashes.json with the whole mapping on every record.
class DigestLedger {
public:
    using Entries = std::map<std::string, std::string>;

    explicit DigestLedger(std::filesystem::path rootDir);

    // Create an empty JSON object ledger if the file does not exist yet.
    bool bootstrapIfAbsent() const;
    // Insert or overwrite one entry, then persist the full mapping; returns false if the write failed.
    bool record(const std::string& destination, const std::string& finalFilename, const std::string& digestHex);

    const Entries& entries() const { return m_entries; }
    const std::filesystem::path& ledgerPath() const { return m_ledgerPath; }

    static std::string makeKey(const std::string& destination, const std::string& finalFilename);
    // Read a ledger file back; nullopt unless it holds a JSON object of strings.
    static std::optional<Entries> readFile(const std::filesystem::path& ledgerPath);

    static constexpr const char* kFileName = "fileHashes.json";

private:
    bool writeEntries() const;

    std::filesystem::path m_ledgerPath;
    Entries m_entries;
};

#endif
