#undef NDEBUG
#include <cassert>
#include <iostream>

#include "SettingsStore.hpp"
#include "TestSupport.hpp"

static void testBootstrapWritesDefaults() {
    TempDir dir("settings_bootstrap");
    SettingsStore store(dir.path());
    assert(!std::filesystem::exists(store.settingsPath()));

    auto settings = store.load();
    assert(settings.has_value());
    assert(std::filesystem::exists(store.settingsPath()));
    assert(settings->running);
    assert(settings->digestEnabled);
    assert(settings->digestAlgorithm == "MD5");
    assert(settings->watchDirectory == "Images");
}

static void testReadsCaseInsensitiveKeys() {
    TempDir dir("settings_keys");
    writeFile(dir.path() / SettingsStore::kFileName,
              "# drop folder\n"
              "[settings]\n"
              "isRunning = true\n"
              "getHashes: false\n"
              "HASHMETHOD = SHA-256\n"
              "currentPathName =  Incoming Files  \n");

    auto settings = SettingsStore(dir.path()).load();
    assert(settings.has_value());
    assert(settings->running);
    assert(!settings->digestEnabled);
    assert(settings->digestAlgorithm == "SHA-256");
    assert(settings->watchDirectory == "Incoming Files");
}

static void testNonTrueFlagsReadAsFalse() {
    TempDir dir("settings_flags");
    writeFile(dir.path() / SettingsStore::kFileName,
              "[settings]\nisrunning = yes\ngethashes = True\nhashmethod = MD5\ncurrentpathname = Images\n");

    auto settings = SettingsStore(dir.path()).load();
    assert(settings.has_value());
    assert(!settings->running);
    assert(!settings->digestEnabled);
}

static void testMissingKeyIsAnError() {
    TempDir dir("settings_missing");
    const std::string original = "[settings]\nisrunning = true\ngethashes = true\nhashmethod = MD5\n";
    writeFile(dir.path() / SettingsStore::kFileName, original);

    assert(!SettingsStore(dir.path()).load().has_value());
    // A malformed file is never repaired with defaults.
    assert(readFile(dir.path() / SettingsStore::kFileName) == original);
}

static void testMalformedFileIsAnError() {
    TempDir dir("settings_malformed");
    writeFile(dir.path() / SettingsStore::kFileName, "[settings\nisrunning = true\n");
    assert(!SettingsStore(dir.path()).load().has_value());

    writeFile(dir.path() / SettingsStore::kFileName, "isrunning = true\n");
    assert(!SettingsStore(dir.path()).load().has_value());

    writeFile(dir.path() / SettingsStore::kFileName, "[settings]\njust some words\n");
    assert(!SettingsStore(dir.path()).load().has_value());

    writeFile(dir.path() / SettingsStore::kFileName,
              "[other]\nisrunning = true\ngethashes = true\nhashmethod = MD5\ncurrentpathname = Images\n");
    assert(!SettingsStore(dir.path()).load().has_value());
}

static void testMalformedFileLogsConfigError() {
    TempDir dir("settings_kind");
    writeFile(dir.path() / SettingsStore::kFileName, "[settings]\nisrunning = true\n");

    CerrCapture captured;
    assert(!SettingsStore(dir.path()).load().has_value());
    assert(captured.text().find("config error: ") != std::string::npos);
    assert(captured.text().find("getHashes") != std::string::npos);
}

// Simplified INI rules: repeated keys keep the last value and indented lines are ordinary entries.
static void testRepeatedAndIndentedKeys() {
    TempDir dir("settings_limits");
    writeFile(dir.path() / SettingsStore::kFileName,
              "[settings]\n"
              "isrunning = false\n"
              "isrunning = true\n"
              "gethashes = true\n"
              "hashmethod = MD5\n"
              "    currentpathname = Inbox\n");

    auto settings = SettingsStore(dir.path()).load();
    assert(settings.has_value());
    assert(settings->running);
    assert(settings->watchDirectory == "Inbox");
}

static void testSaveThenReload() {
    TempDir dir("settings_save");
    SettingsStore store(dir.path());

    Settings settings;
    settings.running = false;
    settings.digestEnabled = true;
    settings.digestAlgorithm = "SHA-1";
    settings.watchDirectory = "Drop";
    assert(store.save(settings));

    auto reloaded = store.load();
    assert(reloaded.has_value());
    assert(!reloaded->running);
    assert(reloaded->digestEnabled);
    assert(reloaded->digestAlgorithm == "SHA-1");
    assert(reloaded->watchDirectory == "Drop");
}

int main() {
    testBootstrapWritesDefaults();
    testReadsCaseInsensitiveKeys();
    testNonTrueFlagsReadAsFalse();
    testMissingKeyIsAnError();
    testMalformedFileIsAnError();
    testMalformedFileLogsConfigError();
    testRepeatedAndIndentedKeys();
    testSaveThenReload();
    std::cout << "✓ SettingsStore tests passed\n";
    return 0;
}
