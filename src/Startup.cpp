#include "Startup.hpp"

#include <iostream>

std::optional<StartupState> loadStartupState(const SettingsStore& settingsStore, const PathRegistry& registry) {
    auto settings = settingsStore.load();
    if (!settings) {
        std::cerr << "Failed to load settings from " << settingsStore.settingsPath() << "." << std::endl;
        return std::nullopt;
    }

    auto prefixes = registry.load();
    if (!prefixes) {
        std::cerr << "Failed to load prefix list from " << registry.registryPath() << "." << std::endl;
        return std::nullopt;
    }

    if (settings->running && !registry.ensureDirectories(*prefixes)) {
        std::cerr << "One or more destination directories could not be created; matching files will fail to move." << std::endl;
    }

    return StartupState{std::move(*settings), std::move(*prefixes)};
}
