#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

// Category of failure, used when reporting per-file and per-cycle results.
enum class FailureKind {
    None,
    Config,
    Registry,
    IO,
    Move
};

// Short human readable label for log lines.
const char* failureKindName(FailureKind kind);
// Start an error line on std::cerr tagged with the failure kind.
std::ostream& logFailure(FailureKind kind);

enum class FileStatus {
    Moved,
    MoveFailed,
    DigestFailed
};

// Result of processing one candidate file within a cycle.
struct FileResult {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string prefix;
    std::string finalName;
    FileStatus status = FileStatus::Moved;
    FailureKind kind = FailureKind::None;
    std::string message;
    std::string digest;
};

// Aggregate of one polling cycle. The cycle keeps going past individual failures.
struct CycleSummary {
    std::size_t listed = 0;
    std::size_t unmatched = 0;
    std::size_t moved = 0;
    std::size_t digested = 0;
    // Set when the watch directory itself could not be prepared or listed.
    bool watchFolderFailed = false;
    std::vector<FileResult> results;

    std::size_t failureCount() const;
};

#endif
