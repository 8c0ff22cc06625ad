#ifndef STARTUP_HPP
#define STARTUP_HPP

#include "PathRegistry.hpp"
#include "SettingsStore.hpp"

#include <optional>

// Settings and prefixes as read once before the polling loop starts.
struct StartupState {
    Settings settings;
    PrefixSet prefixes;
};

// Bootstrap and read both config.ini and filePaths.json, whatever isRunning says.
// Destination folders are only created when the janitor is going to run.
std::optional<StartupState> loadStartupState(const SettingsStore& settingsStore, const PathRegistry& registry);

#endif
