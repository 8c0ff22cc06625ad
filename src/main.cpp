#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "DigestLedger.hpp"
#include "Dispatcher.hpp"
#include "PathRegistry.hpp"
#include "SettingsStore.hpp"
#include "Startup.hpp"

int main() {
    // Resources live next to wherever the janitor is started from.
    std::error_code cwdErr;
    const std::filesystem::path rootDir = std::filesystem::current_path(cwdErr);
    if (cwdErr) {
        std::cerr << "Unable to determine the working directory: " << cwdErr.message() << std::endl;
        return EXIT_FAILURE;
    }

    SettingsStore settingsStore(rootDir);
    PathRegistry registry(rootDir);
    auto startup = loadStartupState(settingsStore, registry);
    if (!startup) {
        std::cerr << "Startup failed. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    const Settings& settings = startup->settings;
    if (!settings.running) {
        std::cout << "isRunning is false in " << settingsStore.settingsPath() << "; nothing to do." << std::endl;
        return EXIT_SUCCESS;
    }

    const std::filesystem::path watchFolder = rootDir / settings.watchDirectory;
    std::error_code watchErr;
    if (!std::filesystem::exists(watchFolder, watchErr) && !watchErr) {
        std::filesystem::create_directories(watchFolder, watchErr);
    }
    if (watchErr) {
        std::cerr << "Unable to prepare watch folder `" << watchFolder.string() << "`: " << watchErr.message() << std::endl;
    }

    DigestLedger ledger(rootDir);
    const DispatcherOptions options;
    Dispatcher dispatcher(rootDir, settingsStore, registry, std::move(startup->prefixes), ledger, options);

    std::cout << "Watching `" << watchFolder.string() << "` every " << options.pollInterval.count() << " ms..." << std::endl;
    if (!dispatcher.run()) {
        std::cerr << "Polling stopped unexpectedly." << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
