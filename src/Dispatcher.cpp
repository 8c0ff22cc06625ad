#include "Dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>
#include <vector>

Dispatcher::Dispatcher(std::filesystem::path rootDir,
                       const SettingsStore& settingsStore,
                       const PathRegistry& registry,
                       PrefixSet prefixes,
                       DigestLedger& ledger,
                       DispatcherOptions options)
    : m_rootDir(std::move(rootDir)),
      m_settingsStore(settingsStore),
      m_registry(registry),
      m_prefixes(std::move(prefixes)),
      m_ledger(ledger),
      m_options(options) {}

void Dispatcher::setCycleObserver(CycleObserver observer) {
    m_observer = std::move(observer);
}

bool Dispatcher::run() {
    if (m_finished) {
        std::cerr << "Dispatcher has already stopped; restart the process to resume polling." << std::endl;
        return true;
    }

    std::this_thread::sleep_for(m_options.startupDelay);
    m_state = DispatcherState::Running;

    while (m_state == DispatcherState::Running) {
        // Settings are re-read every tick so external edits apply on the next cycle.
        const std::optional<Settings> settings = m_settingsStore.load();
        if (!settings) {
            logFailure(FailureKind::Config) << "Stopping: settings could not be reloaded." << std::endl;
            m_state = DispatcherState::Stopped;
            m_finished = true;
            return false;
        }

        if (!settings->running) {
            std::cout << "isRunning is false, stopping." << std::endl;
            m_state = DispatcherState::Stopped;
            break;
        }

        const CycleSummary summary = runCycle(*settings);
        if (m_observer) {
            m_observer(summary);
        }

        std::this_thread::sleep_for(m_options.pollInterval);
    }

    m_finished = true;
    return true;
}

CycleSummary Dispatcher::runCycle(const Settings& settings) {
    CycleSummary summary;

    const auto watchFolder = prepareWatchFolder(settings);
    if (watchFolder.empty()) {
        summary.watchFolderFailed = true;
        return summary;
    }

    std::error_code ec;
    std::filesystem::directory_iterator iter(watchFolder, ec);
    if (ec) {
        std::cerr << "Unable to enumerate `" << watchFolder.string() << "`: " << ec.message() << std::endl;
        summary.watchFolderFailed = true;
        return summary;
    }

    std::vector<std::filesystem::path> candidates;
    for (const auto& entry : iter) {
        ec.clear();
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        candidates.push_back(entry.path());
    }
    std::sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename() < rhs.filename();
    });

    std::cout << "Running" << std::endl;
    std::cout << "Files in `" << watchFolder.string() << "`:";
    for (const auto& candidate : candidates) {
        std::cout << " `" << candidate.filename().string() << "`";
    }
    std::cout << std::endl;

    summary.listed = candidates.size();
    for (const auto& sourcePath : candidates) {
        const auto prefix = matchPrefix(sourcePath.filename().string());
        if (!prefix) {
            ++summary.unmatched;
            continue;
        }

        FileResult result = processFile(sourcePath, *prefix, settings);
        if (result.status != FileStatus::MoveFailed) {
            ++summary.moved;
        }
        if (!result.digest.empty()) {
            ++summary.digested;
        }
        summary.results.push_back(std::move(result));
    }

    logSummary(summary);
    return summary;
}

std::filesystem::path Dispatcher::prepareWatchFolder(const Settings& settings) const {
    // An absolute currentPathName replaces the root entirely.
    const std::filesystem::path watchFolder = m_rootDir / settings.watchDirectory;

    std::error_code ec;
    if (std::filesystem::is_directory(watchFolder, ec)) {
        return watchFolder;
    }

    if (std::filesystem::exists(watchFolder, ec)) {
        std::cerr << "Watch folder `" << watchFolder.string() << "` is not a directory." << std::endl;
        return {};
    }

    ec.clear();
    std::filesystem::create_directories(watchFolder, ec);
    if (ec) {
        std::cerr << "Failed to create watch folder `" << watchFolder.string() << "`: " << ec.message() << std::endl;
        return {};
    }

    std::cout << "Created watch folder `" << watchFolder.string() << "`" << std::endl;
    return watchFolder;
}

std::optional<std::string> Dispatcher::matchPrefix(const std::string& filename) const {
    for (const auto& prefix : m_prefixes) {
        if (filename.compare(0, prefix.size(), prefix) == 0) {
            return prefix;
        }
    }
    return std::nullopt;
}

std::string Dispatcher::strippedName(const std::string& filename, const std::string& prefix) {
    // Only a leading "<prefix> " token is removed; later occurrences stay in the name.
    const std::string token = prefix + " ";
    if (filename.size() > token.size() && filename.compare(0, token.size(), token) == 0) {
        return filename.substr(token.size());
    }
    return filename;
}

FileResult Dispatcher::processFile(const std::filesystem::path& sourcePath, const std::string& prefix, const Settings& settings) {
    FileResult result;
    result.source = sourcePath;
    result.prefix = prefix;
    result.finalName = strippedName(sourcePath.filename().string(), prefix);

    const auto destinationDir = m_registry.destinationFor(prefix);
    result.destination = destinationDir / result.finalName;

    std::error_code mkdirErr;
    std::filesystem::create_directories(destinationDir, mkdirErr);
    if (mkdirErr) {
        result.status = FileStatus::MoveFailed;
        result.kind = FailureKind::Move;
        result.message = "cannot create destination directory: " + mkdirErr.message();
        std::cerr << "Failed to create destination directory `" << destinationDir.string() << "`: " << mkdirErr.message() << std::endl;
        return result;
    }

    if (!moveFile(sourcePath, result.destination, result.message)) {
        result.status = FileStatus::MoveFailed;
        result.kind = FailureKind::Move;
        return result;
    }

    if (!settings.digestEnabled) {
        return result;
    }

    const DigestAlgorithm algorithm = digestAlgorithmFromName(settings.digestAlgorithm);
    std::string digest;
    if (!m_engine.compute(result.destination, algorithm, digest)) {
        // The file stays in its new home without a ledger entry.
        result.status = FileStatus::DigestFailed;
        result.kind = FailureKind::IO;
        result.message = "could not hash moved file";
        return result;
    }

    std::cout << digestAlgorithmName(algorithm) << " `" << result.destination.string() << "` " << digest << std::endl;
    if (!m_ledger.record(prefix, result.finalName, digest)) {
        // The ledger keeps the entry in memory; the next successful write persists it.
        result.status = FileStatus::DigestFailed;
        result.kind = FailureKind::IO;
        result.message = "could not write digest ledger, entry kept in memory";
        return result;
    }

    result.digest = std::move(digest);
    return result;
}

bool Dispatcher::moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const {
    std::error_code renameErr;
    std::filesystem::rename(sourcePath, targetPath, renameErr);
    if (!renameErr) {
        std::cout << "Moved `" << sourcePath.string() << "` -> `" << targetPath.string() << "`" << std::endl;
        return true;
    }

    if (renameErr == std::errc::cross_device_link) {
        std::error_code copyErr;
        std::filesystem::copy_file(sourcePath, targetPath, std::filesystem::copy_options::overwrite_existing, copyErr);
        if (!copyErr) {
            std::error_code removeErr;
            std::filesystem::remove(sourcePath, removeErr);
            if (!removeErr) {
                std::cout << "Copied `" << sourcePath.string() << "` -> `" << targetPath.string() << "` (cross-device move)" << std::endl;
                return true;
            }
            error = "copied but could not remove source: " + removeErr.message();
            std::cerr << "Failed to remove original file `" << sourcePath.string() << "` after copy: " << removeErr.message() << std::endl;
            return false;
        }

        error = "cross-device copy failed: " + copyErr.message();
        std::cerr << "Failed to copy `" << sourcePath.string() << "` to `" << targetPath.string() << "`: " << copyErr.message() << std::endl;
        return false;
    }

    error = renameErr.message();
    std::cerr << "Failed to move `" << sourcePath.string() << "`: " << renameErr.message() << std::endl;
    return false;
}

void Dispatcher::logSummary(const CycleSummary& summary) const {
    if (summary.results.empty()) {
        return;
    }

    std::cout << "Cycle done: " << summary.moved << " moved, " << summary.digested << " hashed, "
              << summary.unmatched << " left in place, " << summary.failureCount() << " failed." << std::endl;
    for (const auto& result : summary.results) {
        if (result.kind == FailureKind::None) {
            continue;
        }
        std::cerr << "  `" << result.source.filename().string() << "`: " << failureKindName(result.kind) << ": "
                  << result.message << std::endl;
    }
}
