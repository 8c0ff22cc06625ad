#include "Outcome.hpp"

#include <algorithm>
#include <iostream>

const char* failureKindName(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::Config:
        return "config error";
    case FailureKind::Registry:
        return "registry error";
    case FailureKind::IO:
        return "I/O error";
    case FailureKind::Move:
        return "move error";
    }
    return "unknown error";
}

std::ostream& logFailure(FailureKind kind) {
    return std::cerr << failureKindName(kind) << ": ";
}

std::size_t CycleSummary::failureCount() const {
    const auto failed = std::count_if(results.begin(), results.end(), [](const FileResult& result) {
        return result.kind != FailureKind::None;
    });
    return static_cast<std::size_t>(failed) + (watchFolderFailed ? 1 : 0);
}
