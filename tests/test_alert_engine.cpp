#include <catch2/catch_test_macros.hpp>
#include "hostmon/alert_engine.hpp"

namespace {

hostmon::Snapshot make_snapshot(int cpu, int ram, int disk, int swap = 0) {
    return hostmon::Snapshot(cpu, ram, swap, disk, std::nullopt, std::chrono::system_clock::now());
}

} // namespace

TEST_CASE("AlertEngine uses strict greater-than", "[alerts]") {
    hostmon::ThresholdConfig thresholds;
    hostmon::AlertEngine engine(thresholds);

    SECTION("Values equal to the limits raise nothing") {
        auto alerts = engine.evaluate(make_snapshot(80, 85, 90));
        REQUIRE(alerts.empty());
    }

    SECTION("RAM at 85% with the default limit raises nothing") {
        REQUIRE_FALSE(engine.check_ram(make_snapshot(0, 85, 0)).has_value());
    }

    SECTION("One above each limit raises each alert") {
        REQUIRE(engine.check_cpu(make_snapshot(81, 0, 0)).has_value());
        REQUIRE(engine.check_ram(make_snapshot(0, 86, 0)).has_value());
        REQUIRE(engine.check_disk(make_snapshot(0, 0, 91)).has_value());
    }
}

TEST_CASE("AlertEngine classifies severity per metric", "[alerts]") {
    hostmon::AlertEngine engine(hostmon::ThresholdConfig{});

    SECTION("CPU and disk are critical, RAM is a warning") {
        auto alerts = engine.evaluate(make_snapshot(95, 95, 95));
        REQUIRE(alerts.size() == 3);

        REQUIRE(alerts[0].metric == hostmon::Metric::Cpu);
        REQUIRE(alerts[0].level == hostmon::AlertLevel::Critical);
        REQUIRE(alerts[0].observed_value == 95);
        REQUIRE(alerts[0].message == "CPU usage: 95%");

        REQUIRE(alerts[1].metric == hostmon::Metric::Ram);
        REQUIRE(alerts[1].level == hostmon::AlertLevel::Warning);

        REQUIRE(alerts[2].metric == hostmon::Metric::Disk);
        REQUIRE(alerts[2].level == hostmon::AlertLevel::Critical);
        REQUIRE(alerts[2].title == "Low disk space");
    }

    SECTION("Breaches are evaluated independently") {
        auto alerts = engine.evaluate(make_snapshot(10, 10, 99));
        REQUIRE(alerts.size() == 1);
        REQUIRE(alerts[0].metric == hostmon::Metric::Disk);
    }

    SECTION("Swap never escalates to critical") {
        for (int swap : {51, 75, 100}) {
            auto alert = engine.check_swap(make_snapshot(0, 0, 0, swap));
            REQUIRE(alert.has_value());
            REQUIRE(alert->level == hostmon::AlertLevel::Warning);
        }
        REQUIRE_FALSE(engine.check_swap(make_snapshot(0, 0, 0, 50)).has_value());
    }

    SECTION("Swap is not part of evaluate()") {
        auto alerts = engine.evaluate(make_snapshot(0, 0, 0, 100));
        REQUIRE(alerts.empty());
    }
}

TEST_CASE("AlertEngine honours configured limits", "[alerts]") {
    hostmon::ThresholdConfig thresholds;
    thresholds.cpu_limit = 50;
    thresholds.swap_warn_limit = 10;
    hostmon::AlertEngine engine(thresholds);

    REQUIRE(engine.check_cpu(make_snapshot(51, 0, 0)).has_value());
    REQUIRE_FALSE(engine.check_cpu(make_snapshot(50, 0, 0)).has_value());
    REQUIRE(engine.check_swap(make_snapshot(0, 0, 0, 11)).has_value());
}

TEST_CASE("Level names", "[alerts]") {
    REQUIRE(std::string(hostmon::to_string(hostmon::AlertLevel::Critical)) == "critical");
    REQUIRE(std::string(hostmon::to_string(hostmon::AlertLevel::Warning)) == "warning");
    REQUIRE(std::string(hostmon::to_string(hostmon::Metric::Ram)) == "RAM");
}
