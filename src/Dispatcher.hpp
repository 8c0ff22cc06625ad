#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "DigestEngine.hpp"
#include "DigestLedger.hpp"
#include "Outcome.hpp"
#include "PathRegistry.hpp"
#include "SettingsStore.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

enum class DispatcherState {
    Stopped,
    Running
};

struct DispatcherOptions {
    std::chrono::milliseconds startupDelay{2000};
    std::chrono::milliseconds pollInterval{3000};
};

// Polls the watch folder, moves prefixed files into their destination folders and
// optionally records their digests.
class Dispatcher {
public:
    using CycleObserver = std::function<void(const CycleSummary&)>;

    Dispatcher(std::filesystem::path rootDir,
               const SettingsStore& settingsStore,
               const PathRegistry& registry,
               PrefixSet prefixes,
               DigestLedger& ledger,
               DispatcherOptions options = {});

    // Poll until the settings report isRunning=false (returns true) or can no longer be read (returns false).
    bool run();
    // Process the watch folder once using the given settings snapshot.
    CycleSummary runCycle(const Settings& settings);
    // Called after every cycle run by run().
    void setCycleObserver(CycleObserver observer);

    DispatcherState state() const { return m_state; }

    // Name a matched file receives in its destination folder.
    static std::string strippedName(const std::string& filename, const std::string& prefix);

private:
    // Resolve the watch folder for the snapshot, creating it when missing; empty on failure.
    std::filesystem::path prepareWatchFolder(const Settings& settings) const;
    // First registered prefix the filename starts with.
    std::optional<std::string> matchPrefix(const std::string& filename) const;
    // Move, then hash and record when enabled.
    FileResult processFile(const std::filesystem::path& sourcePath, const std::string& prefix, const Settings& settings);
    // Perform the filesystem move, falling back to copy and remove across devices.
    bool moveFile(const std::filesystem::path& sourcePath, const std::filesystem::path& targetPath, std::string& error) const;
    void logSummary(const CycleSummary& summary) const;

    std::filesystem::path m_rootDir;
    const SettingsStore& m_settingsStore;
    const PathRegistry& m_registry;
    PrefixSet m_prefixes;
    DigestLedger& m_ledger;
    DigestEngine m_engine;
    DispatcherOptions m_options;
    CycleObserver m_observer;
    DispatcherState m_state = DispatcherState::Stopped;
    // Stopped is terminal once a run has ended.
    bool m_finished = false;
};

#endif
