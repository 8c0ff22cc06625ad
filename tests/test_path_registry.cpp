#undef NDEBUG
#include <cassert>
#include <iostream>

#include "PathRegistry.hpp"
#include "TestSupport.hpp"

static void testBootstrapPlaceholder() {
    TempDir dir("registry_bootstrap");
    PathRegistry registry(dir.path());

    auto prefixes = registry.load();
    assert(prefixes.has_value());
    assert(prefixes->size() == 1);
    assert(prefixes->front() == "empty");
    assert(std::filesystem::exists(registry.registryPath()));
}

static void testKeepsRegistryOrder() {
    TempDir dir("registry_order");
    writeFile(dir.path() / PathRegistry::kFileName, R"(["cats", "cat", "dogs"])");

    auto prefixes = PathRegistry(dir.path()).load();
    assert(prefixes.has_value());
    assert((*prefixes == PrefixSet{"cats", "cat", "dogs"}));
}

static void testRejectsMalformedLists() {
    TempDir dir("registry_malformed");
    const auto file = dir.path() / PathRegistry::kFileName;

    writeFile(file, R"({"cats": true})");
    assert(!PathRegistry(dir.path()).load().has_value());

    writeFile(file, R"(["cats", 3])");
    assert(!PathRegistry(dir.path()).load().has_value());

    writeFile(file, R"(["cats", ""])");
    assert(!PathRegistry(dir.path()).load().has_value());

    writeFile(file, "[\"cats\"");
    assert(!PathRegistry(dir.path()).load().has_value());
    // Present but broken files are left alone.
    assert(readFile(file) == "[\"cats\"");
}

static void testMalformedListLogsRegistryError() {
    TempDir dir("registry_kind");
    writeFile(dir.path() / PathRegistry::kFileName, R"("just a string")");

    CerrCapture captured;
    assert(!PathRegistry(dir.path()).load().has_value());
    assert(captured.text().find("registry error: ") != std::string::npos);
}

static void testEnsureDirectories() {
    TempDir dir("registry_dirs");
    PathRegistry registry(dir.path());
    const PrefixSet prefixes{"photos", "scans"};

    assert(registry.ensureDirectories(prefixes));
    assert(std::filesystem::is_directory(dir.path() / "photos"));
    assert(std::filesystem::is_directory(dir.path() / "scans"));
    assert(registry.destinationFor("photos") == dir.path() / "photos");

    // Idempotent.
    writeFile(dir.path() / "photos" / "keep.png", "x");
    assert(registry.ensureDirectories(prefixes));
    assert(std::filesystem::exists(dir.path() / "photos" / "keep.png"));
}

static void testEnsureDirectoriesBlockedByFile() {
    TempDir dir("registry_blocked");
    writeFile(dir.path() / "blocked", "not a directory");
    PathRegistry registry(dir.path());

    assert(!registry.ensureDirectories(PrefixSet{"blocked", "fine"}));
    assert(std::filesystem::is_regular_file(dir.path() / "blocked"));
    assert(std::filesystem::is_directory(dir.path() / "fine"));
}

int main() {
    testBootstrapPlaceholder();
    testKeepsRegistryOrder();
    testRejectsMalformedLists();
    testMalformedListLogsRegistryError();
    testEnsureDirectories();
    testEnsureDirectoriesBlockedByFile();
    std::cout << "✓ PathRegistry tests passed\n";
    return 0;
}
