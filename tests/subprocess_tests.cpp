// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <openpath/browser/native_host.hpp>
#include <openpath/process/subprocess.hpp>
#include "test_support.hpp"
#include <chrono>

using namespace openpath::process;
using namespace std::chrono_literals;

namespace {

const std::filesystem::path SH = "/bin/sh";

ProcessOutcome sh(const std::string& script, std::vector<std::string> extra = {},
                  std::chrono::milliseconds timeout = 5000ms) {
    std::vector<std::string> args{"-c", script, "sh"};
    args.insert(args.end(), extra.begin(), extra.end());
    return run_process(SH, args, timeout);
}

} // namespace

TEST_CASE("run_process captures output", "[process]") {
    SECTION("stdout and stderr are kept apart") {
        auto result = sh("echo to-out; echo to-err >&2");
        REQUIRE(result.has_value());
        CHECK(result->out == "to-out\n");
        CHECK(result->err == "to-err\n");
        CHECK(result->exit_code == 0);
        CHECK(result->succeeded());
    }

    SECTION("Nonzero exit is a normal result") {
        auto result = sh("echo partial; exit 3");
        REQUIRE(result.has_value());
        CHECK(result->exit_code == 3);
        CHECK_FALSE(result->succeeded());
        CHECK(result->out == "partial\n");
    }

    SECTION("Killed by a signal reports 128 + signal") {
        auto result = sh("kill -9 $$");
        REQUIRE(result.has_value());
        CHECK(result->exit_code == 128 + 9);
    }

    SECTION("Large output on both pipes does not block") {
        auto result = sh("head -c 300000 /dev/zero; head -c 200000 /dev/zero >&2");
        REQUIRE(result.has_value());
        CHECK(result->out.size() == 300000);
        CHECK(result->err.size() == 200000);
    }

    SECTION("stdin is empty") {
        auto result = sh("cat; echo done");
        REQUIRE(result.has_value());
        CHECK(result->out == "done\n");
    }
}

TEST_CASE("run_process passes arguments literally", "[process]") {
    const std::string hostile = "a;rm -rf / $(id) `id` | cat > x";
    auto result = sh("printf '%s' \"$1\"", {hostile});
    REQUIRE(result.has_value());
    CHECK(result->out == hostile);
}

TEST_CASE("run_process restores SIGPIPE for children", "[process]") {
    openpath::browser::ignore_broken_pipe();

    // With SIGPIPE ignored, yes would report EPIPE on stderr instead of dying quietly
    auto result = sh("yes | head -c 1 >/dev/null; echo done");
    REQUIRE(result.has_value());
    CHECK(result->out == "done\n");
    CHECK(result->err.empty());
    CHECK(result->exit_code == 0);
}

TEST_CASE("run_process timeout", "[process]") {
    const auto start = std::chrono::steady_clock::now();
    auto result = sh("echo started; sleep 30", {}, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == ProcessErrc::timed_out);
    CHECK(is_timeout(result.error()));
    CHECK(elapsed < 10s);
}

TEST_CASE("run_process launch failures", "[process]") {
    SECTION("Missing executable") {
        auto result = run_process("/nonexistent/openpath-whitelist", {"status"}, 5000ms);
        REQUIRE_FALSE(result.has_value());
        CHECK_FALSE(is_timeout(result.error()));
        CHECK(result.error() == std::errc::no_such_file_or_directory);
    }

    SECTION("Not executable") {
        openpath::test::TempDir dir;
        auto script = dir.path / "plain.txt";
        openpath::test::write_file(script, "echo hi\n");

        auto result = run_process(script, {}, 5000ms);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == std::errc::permission_denied);
    }
}

TEST_CASE("SubprocessRunner forwards to run_process", "[process]") {
    SubprocessRunner runner;
    CommandRunner& base = runner;
    auto result = base.run(SH, {"-c", "echo $0 $1", "x", "y"}, 5000ms);
    REQUIRE(result.has_value());
    CHECK(result->out == "x y\n");
}
