#include <catch2/catch_test_macros.hpp>

#include "platform/platform_paths.hpp"
#include "platform/process.hpp"
#include "test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("platform::run_process", "[process]") {

    SECTION("SuccessfulCommand") {
        REQUIRE(platform::run_process({"true"}).has_value());
    }

    SECTION("NonZeroExitCarriesStderr") {
        auto res = platform::run_process({"sh", "-c", "echo 'bad input' >&2; exit 3"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "sh exited with code 3: bad input");
    }

    SECTION("MissingExecutable") {
        auto res = platform::run_process({"/nonexistent/subtitle-ai-tool"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "/nonexistent/subtitle-ai-tool could not be executed");
    }

    SECTION("EmptyCommandLine") {
        REQUIRE_FALSE(platform::run_process({}).has_value());
    }

    SECTION("ArgumentsAreNotShellExpanded") {
        REQUIRE(platform::run_process({"test", "a b", "=", "a b"}).has_value());
    }
}

TEST_CASE("platform::make_executable", "[process]") {
    testing::TmpDir dir;

    SECTION("AddsExecuteBits") {
        auto tool = dir / "tool";
        testing::write_file(tool, "#!/bin/sh\nexit 0\n");
        fs::permissions(tool, fs::perms::owner_read | fs::perms::owner_write);

        REQUIRE(platform::make_executable(tool).has_value());
        auto perms = fs::status(tool).permissions();
        REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
        REQUIRE((perms & fs::perms::others_exec) != fs::perms::none);
        REQUIRE((perms & fs::perms::owner_read) != fs::perms::none);
        REQUIRE(platform::run_process({tool.string()}).has_value());
    }

    SECTION("MissingFileFails") {
        auto res = platform::make_executable(dir / "missing");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().starts_with("chmod +x "));
    }
}
