#undef NDEBUG
#include <cassert>
#include <iostream>

#include "PathRegistry.hpp"
#include "SettingsStore.hpp"
#include "Startup.hpp"
#include "TestSupport.hpp"

static void testFreshRootBootstrapsEverything() {
    TempDir dir("startup_fresh");
    SettingsStore settingsStore(dir.path());
    PathRegistry registry(dir.path());

    auto startup = loadStartupState(settingsStore, registry);
    assert(startup.has_value());
    assert(startup->settings.running);
    assert((startup->prefixes == PrefixSet{"empty"}));
    assert(std::filesystem::exists(settingsStore.settingsPath()));
    assert(std::filesystem::exists(registry.registryPath()));
    assert(std::filesystem::is_directory(dir.path() / "empty"));
}

static void testStoppedStillBootstrapsPrefixList() {
    TempDir dir("startup_stopped");
    SettingsStore settingsStore(dir.path());
    Settings stopped;
    stopped.running = false;
    assert(settingsStore.save(stopped));
    PathRegistry registry(dir.path());

    auto startup = loadStartupState(settingsStore, registry);
    assert(startup.has_value());
    assert(!startup->settings.running);
    assert(std::filesystem::exists(registry.registryPath()));
    // Folders are only prepared when the janitor is going to run.
    assert(!std::filesystem::exists(dir.path() / "empty"));
}

static void testMalformedPrefixListFailsStartup() {
    TempDir dir("startup_badlist");
    writeFile(dir.path() / PathRegistry::kFileName, "{}");
    SettingsStore settingsStore(dir.path());
    PathRegistry registry(dir.path());

    assert(!loadStartupState(settingsStore, registry).has_value());
}

int main() {
    testFreshRootBootstrapsEverything();
    testStoppedStillBootstrapsPrefixList();
    testMalformedPrefixListFailsStartup();
    std::cout << "✓ Startup tests passed\n";
    return 0;
}
