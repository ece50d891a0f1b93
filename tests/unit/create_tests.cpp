#include <doctest/doctest.h>
#include <runfiles/runfiles.hpp>

#include "test_helpers.hpp"

#include <cstdlib>

using namespace runfiles;
using runfiles::test::TempDir;

namespace {

const DirectoryRunfiles& as_directory(const Runfiles& rf) {
    REQUIRE(rf.mode() == Mode::Directory);
    return static_cast<const DirectoryRunfiles&>(rf);
}

} // namespace

// ============================================================================
// Strategy selection
// ============================================================================

TEST_CASE("manifest only mode uses the manifest file") {
    TempDir dir;
    auto manifest = dir.write("MANIFEST", "a/b c/d\n");
    auto r = Runfiles::create({{"RUNFILES_MANIFEST_ONLY", "1"},
                               {"RUNFILES_MANIFEST_FILE", manifest},
                               {"RUNFILES_DIR", "/ignored"}});
    REQUIRE(r.isOk());
    CHECK(r.value()->mode() == Mode::Manifest);
    auto found = r.value()->rlocation("a/b");
    REQUIRE(found.isOk());
    CHECK(found.value() == std::optional<std::string>("c/d"));
}

TEST_CASE("manifest only mode without a manifest file fails") {
    auto r = Runfiles::create({{"RUNFILES_MANIFEST_ONLY", "1"}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIG_MISSING);
    CHECK(r.error().message().find("RUNFILES_MANIFEST_FILE") != std::string::npos);
}

TEST_CASE("manifest only mode with an empty manifest variable fails") {
    auto r = Runfiles::create({{"RUNFILES_MANIFEST_ONLY", "1"},
                               {"RUNFILES_MANIFEST_FILE", ""},
                               {"RUNFILES_DIR", "/x"}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIG_MISSING);
}

TEST_CASE("manifest only mode with an unreadable manifest fails") {
    TempDir dir;
    auto r = Runfiles::create({{"RUNFILES_MANIFEST_ONLY", "1"},
                               {"RUNFILES_MANIFEST_FILE", dir.path() + "/missing"}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::MANIFEST_UNREADABLE);
    CHECK(std::string(error_code_to_string(r.error().code())) == "MANIFEST_UNREADABLE");
    CHECK(r.error().message().find("$RUNFILES_MANIFEST_FILE: ") == 0);
}

TEST_CASE("RUNFILES_DIR selects directory mode") {
    auto r = Runfiles::create({{"RUNFILES_DIR", "/x"}});
    REQUIRE(r.isOk());
    CHECK(as_directory(*r.value()).directory() == "/x");
}

TEST_CASE("RUNFILES_DIR takes priority over TEST_SRCDIR") {
    auto r = Runfiles::create({{"RUNFILES_DIR", "/x"}, {"TEST_SRCDIR", "/y"}});
    REQUIRE(r.isOk());
    CHECK(as_directory(*r.value()).directory() == "/x");
}

TEST_CASE("TEST_SRCDIR is the directory fallback") {
    auto r = Runfiles::create({{"TEST_SRCDIR", "/y"}});
    REQUIRE(r.isOk());
    CHECK(as_directory(*r.value()).directory() == "/y");
}

TEST_CASE("empty RUNFILES_DIR falls back to TEST_SRCDIR") {
    auto r = Runfiles::create({{"RUNFILES_DIR", ""}, {"TEST_SRCDIR", "/y"}});
    REQUIRE(r.isOk());
    CHECK(as_directory(*r.value()).directory() == "/y");
}

TEST_CASE("manifest flag must be exactly 1") {
    TempDir dir;
    auto manifest = dir.write("MANIFEST", "a b\n");
    for (const char* flag : {"0", "true", "yes", " 1", ""}) {
        auto r = Runfiles::create({{"RUNFILES_MANIFEST_ONLY", flag},
                                   {"RUNFILES_MANIFEST_FILE", manifest},
                                   {"RUNFILES_DIR", "/x"}});
        REQUIRE(r.isOk());
        CHECK(r.value()->mode() == Mode::Directory);
    }
}

TEST_CASE("manifest file alone does not select manifest mode") {
    TempDir dir;
    auto manifest = dir.write("MANIFEST", "a b\n");
    auto r = Runfiles::create({{"RUNFILES_MANIFEST_FILE", manifest}});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIG_MISSING);
}

TEST_CASE("empty environment fails") {
    auto r = Runfiles::create(EnvMap{});
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::CONFIG_MISSING);
    CHECK(r.error().message().find("RUNFILES_DIR") != std::string::npos);
    CHECK(r.error().message().find("TEST_SRCDIR") != std::string::npos);
}

// ============================================================================
// Child process environment
// ============================================================================

TEST_CASE("directory mode exports RUNFILES_DIR") {
    DirectoryRunfiles rf("/x");
    auto env = rf.env_vars();
    CHECK(env.size() == 1);
    CHECK(env.at("RUNFILES_DIR") == "/x");
}

TEST_CASE("manifest mode exports the manifest and its directory") {
    TempDir dir;
    auto manifest = dir.write("bin.runfiles/MANIFEST", "a b\n");
    auto r = ManifestRunfiles::load(manifest);
    REQUIRE(r.isOk());
    auto env = r.value()->env_vars();
    CHECK(env.at("RUNFILES_MANIFEST_ONLY") == "1");
    CHECK(env.at("RUNFILES_MANIFEST_FILE") == manifest);
    CHECK(env.at("RUNFILES_DIR") == dir.path() + "/bin.runfiles");
}

TEST_CASE("exported environment recreates an equivalent instance") {
    TempDir dir;
    auto manifest = dir.write("MANIFEST", "dir1 c/d\n");
    auto first = ManifestRunfiles::load(manifest);
    REQUIRE(first.isOk());

    auto second = Runfiles::create(first.value()->env_vars());
    REQUIRE(second.isOk());
    CHECK(second.value()->mode() == Mode::Manifest);
    auto found = second.value()->rlocation("dir1/x");
    REQUIRE(found.isOk());
    CHECK(found.value() == std::optional<std::string>("c/d/x"));
}

TEST_CASE("runfiles directory derived from manifest name") {
    CHECK(runfiles_dir_for_manifest("/out/bin.runfiles/MANIFEST") ==
          std::optional<std::string>("/out/bin.runfiles"));
    CHECK(runfiles_dir_for_manifest("/out/bin.runfiles_manifest") ==
          std::optional<std::string>("/out/bin.runfiles"));
    CHECK_FALSE(runfiles_dir_for_manifest("/out/files.txt").has_value());
    CHECK_FALSE(runfiles_dir_for_manifest("/MANIFEST").has_value());
}

#ifndef _WIN32
TEST_CASE("create() reads the process environment once") {
    unsetenv("RUNFILES_MANIFEST_ONLY");
    REQUIRE(setenv("RUNFILES_DIR", "/from/process", 1) == 0);
    auto r = Runfiles::create();
    unsetenv("RUNFILES_DIR");
    REQUIRE(r.isOk());

    auto found = r.value()->rlocation("ws/file");
    REQUIRE(found.isOk());
    CHECK(found.value() == std::optional<std::string>("/from/process/ws/file"));
}
#endif
