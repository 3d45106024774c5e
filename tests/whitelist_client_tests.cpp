// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <openpath/core/whitelist_client.hpp>
#include "test_support.hpp"
#include <stdexcept>

using namespace openpath::core;
using namespace openpath::test;
using namespace std::chrono_literals;

TEST_CASE("parse_check_output", "[whitelist]") {
    SECTION("Spanish output, whitelisted and resolving") {
        const std::string out =
            "Dominio: example.com\n"
            "  En whitelist: \x1b[0;32m✓ SÍ\x1b[0m\n"
            "\x1b[0;32m✓\x1b[0m → 93.184.216.34\n";
        auto result = parse_check_output("example.com", out);
        CHECK(result.domain == "example.com");
        CHECK(result.in_whitelist);
        CHECK(result.resolves);
        REQUIRE(result.resolved_ip.has_value());
        CHECK(*result.resolved_ip == "93.184.216.34");
    }

    SECTION("English affirmative") {
        auto result = parse_check_output("a.com", "In whitelist: YES\n");
        CHECK(result.in_whitelist);
        CHECK_FALSE(result.resolves);
        CHECK_FALSE(result.resolved_ip.has_value());
    }

    SECTION("Not whitelisted but resolving") {
        auto result = parse_check_output("b.com", "En whitelist: NO\n→\t10.0.0.1 (cached)\n");
        CHECK_FALSE(result.in_whitelist);
        CHECK(result.resolves);
        REQUIRE(result.resolved_ip.has_value());
        CHECK(*result.resolved_ip == "10.0.0.1");
    }

    SECTION("Arrow with nothing after it") {
        auto result = parse_check_output("c.com", "→   \n");
        CHECK(result.resolves);
        CHECK_FALSE(result.resolved_ip.has_value());
    }

    SECTION("No markers") {
        auto result = parse_check_output("d.com", "");
        CHECK(result.domain == "d.com");
        CHECK_FALSE(result.in_whitelist);
        CHECK_FALSE(result.resolves);
        CHECK_FALSE(result.resolved_ip.has_value());
    }
}

TEST_CASE("parse_domains_output", "[whitelist]") {
    SECTION("Lines are trimmed and blanks dropped") {
        auto domains = parse_domains_output("a.com\n  b.org  \r\n\n\t\nc.net");
        REQUIRE(domains.size() == 3);
        CHECK(domains[0] == "a.com");
        CHECK(domains[1] == "b.org");
        CHECK(domains[2] == "c.net");
    }

    SECTION("Empty output") {
        CHECK(parse_domains_output("").empty());
        CHECK(parse_domains_output("\n\n").empty());
    }
}

TEST_CASE("parse_status_output", "[whitelist]") {
    CHECK(parse_status_output("  dnsmasq: ● ACTIVO\n").active);
    CHECK(parse_status_output("Service is Active").active);
    CHECK_FALSE(parse_status_output("Service stopped").active);
    CHECK(parse_status_output("raw text").output == "raw text");
}

TEST_CASE("WhitelistClient invocations", "[whitelist]") {
    TempDir dir;
    HostConfig config;
    config.whitelist_command = "/opt/openpath/whitelist";
    config.update_script = dir.path / "openpath-update.sh";

    FakeRunner runner;
    WhitelistClient client(runner, config);

    SECTION("check passes the domain as its own argument") {
        runner.respond = [](const FakeRunner::Call&) { return output("✓ SÍ\n→ 1.2.3.4\n"); };

        auto result = client.check("example.com");
        REQUIRE(result.has_value());
        CHECK(result->in_whitelist);
        CHECK(result->resolved_ip == "1.2.3.4");

        REQUIRE(runner.calls.size() == 1);
        CHECK(runner.calls[0].command == "/opt/openpath/whitelist");
        CHECK(runner.calls[0].args == std::vector<std::string>{"check", "example.com"});
        CHECK(runner.calls[0].timeout == 10s);
    }

    SECTION("check still parses output of a failing tool") {
        runner.respond = [](const FakeRunner::Call&) { return output("→ 5.6.7.8\n", 1); };
        auto result = client.check("x.com");
        REQUIRE(result.has_value());
        CHECK(result->resolves);
    }

    SECTION("Runner errors are passed through") {
        runner.respond = [](const FakeRunner::Call&) -> openpath::process::ProcessOutcome {
            return std::unexpected(make_error_code(openpath::process::ProcessErrc::timed_out));
        };
        auto result = client.domains();
        REQUIRE_FALSE(result.has_value());
        CHECK(openpath::process::is_timeout(result.error()));
    }

    SECTION("domains and status use their subcommands") {
        runner.respond = [](const FakeRunner::Call& call) {
            return call.args[0] == "domains" ? output("a.com\nb.com\n") : output("activo");
        };

        auto domains = client.domains();
        REQUIRE(domains.has_value());
        CHECK(domains->size() == 2);

        auto status = client.status();
        REQUIRE(status.has_value());
        CHECK(status->active);

        REQUIRE(runner.calls.size() == 2);
        CHECK(runner.calls[0].args == std::vector<std::string>{"domains"});
        CHECK(runner.calls[1].args == std::vector<std::string>{"status"});
    }

    SECTION("update without a script spawns nothing") {
        CHECK_FALSE(client.update_script_exists());
        auto result = client.update();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == openpath::process::ProcessErrc::not_found);
        CHECK(runner.calls.empty());
    }

    SECTION("A throwing runner surfaces as a launch failure") {
        runner.respond = [](const FakeRunner::Call&) -> openpath::process::ProcessOutcome {
            throw std::runtime_error("runner exploded");
        };
        auto result = client.status();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == openpath::process::ProcessErrc::launch_failed);
    }

    SECTION("update runs the script with --update") {
        write_file(config.update_script, "#!/bin/sh\n");
        runner.respond = [](const FakeRunner::Call&) { return output("done"); };

        auto result = client.update();
        REQUIRE(result.has_value());
        CHECK(result->out == "done");

        REQUIRE(runner.calls.size() == 1);
        CHECK(runner.calls[0].command == config.update_script);
        CHECK(runner.calls[0].args == std::vector<std::string>{"--update"});
        CHECK(runner.calls[0].timeout == 60s);
    }
}
