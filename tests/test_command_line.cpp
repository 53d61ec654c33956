#include <catch2/catch_test_macros.hpp>
#include "hostmon/command_line.hpp"
#include <sstream>

namespace {

bool parse(std::vector<std::string> args, hostmon::CommandLine& cmd, std::string& error) {
    return hostmon::parse_command_line(args, cmd, error);
}

} // namespace

TEST_CASE("Modes are selected by option", "[cli]") {
    hostmon::CommandLine cmd;
    std::string error;

    SECTION("No options is a single snapshot") {
        REQUIRE(parse({}, cmd, error));
        REQUIRE(cmd.mode == hostmon::RunMode::Snapshot);
        REQUIRE_FALSE(cmd.interval.has_value());
    }

    SECTION("Log-only, long and short") {
        REQUIRE(parse({"--log"}, cmd, error));
        REQUIRE(cmd.mode == hostmon::RunMode::LogOnly);
        REQUIRE(parse({"--l"}, cmd, error));
        REQUIRE(cmd.mode == hostmon::RunMode::LogOnly);
    }

    SECTION("Continuous with an interval") {
        REQUIRE(parse({"--c", "5"}, cmd, error));
        REQUIRE(cmd.mode == hostmon::RunMode::Continuous);
        REQUIRE(cmd.interval == 5);
    }

    SECTION("Continuous without an interval uses the configured one") {
        REQUIRE(parse({"--continuous"}, cmd, error));
        REQUIRE(cmd.mode == hostmon::RunMode::Continuous);
        REQUIRE_FALSE(cmd.interval.has_value());
    }

    SECTION("A following long option is not taken as the interval") {
        REQUIRE(parse({"--continuous", "--debug"}, cmd, error));
        REQUIRE_FALSE(cmd.interval.has_value());
        REQUIRE(cmd.debug);
    }

    SECTION("Help and config path") {
        REQUIRE(parse({"--config", "/etc/hostmon.yaml", "-h"}, cmd, error));
        REQUIRE(cmd.show_help);
        REQUIRE(cmd.config_path == "/etc/hostmon.yaml");
    }
}

TEST_CASE("Invalid command lines are rejected", "[cli]") {
    hostmon::CommandLine cmd;
    std::string error;

    SECTION("Non-numeric interval") {
        REQUIRE_FALSE(parse({"--continuous", "abc"}, cmd, error));
        REQUIRE(error == "invalid interval: abc");
    }

    SECTION("Zero and negative intervals") {
        REQUIRE_FALSE(parse({"--c", "0"}, cmd, error));
        REQUIRE_FALSE(parse({"--c", "-5"}, cmd, error));
    }

    SECTION("Unknown option") {
        REQUIRE_FALSE(parse({"--bogus"}, cmd, error));
        REQUIRE(error == "unknown option: --bogus");
    }

    SECTION("Conflicting modes") {
        REQUIRE_FALSE(parse({"--log", "--continuous"}, cmd, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Config without a path") {
        REQUIRE_FALSE(parse({"--config"}, cmd, error));
    }
}

TEST_CASE("parse_interval", "[cli]") {
    int seconds = 0;
    REQUIRE(hostmon::parse_interval("60", seconds));
    REQUIRE(seconds == 60);
    REQUIRE_FALSE(hostmon::parse_interval("", seconds));
    REQUIRE_FALSE(hostmon::parse_interval("1.5", seconds));
    REQUIRE_FALSE(hostmon::parse_interval("9999999999", seconds));
}

TEST_CASE("Usage shows thresholds and log file", "[cli]") {
    hostmon::MonitorConfig config;
    config.alerts.log_path = "/var/log/hostmon.log";

    std::ostringstream out;
    hostmon::print_usage(out, "hostmon", config);
    auto text = out.str();
    REQUIRE(text.find("Usage: hostmon") != std::string::npos);
    REQUIRE(text.find("CPU:  80%") != std::string::npos);
    REQUIRE(text.find("RAM:  85%") != std::string::npos);
    REQUIRE(text.find("Disk: 90%") != std::string::npos);
    REQUIRE(text.find("/var/log/hostmon.log") != std::string::npos);
}
