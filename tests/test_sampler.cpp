#include <catch2/catch_test_macros.hpp>
#include "hostmon/sampler.hpp"
#include "fake_collector.hpp"
#include <algorithm>

namespace {

bool names(const hostmon::Snapshot& snapshot, const std::string& source) {
    const auto& unreadable = snapshot.unreadable();
    return std::find(unreadable.begin(), unreadable.end(), source) != unreadable.end();
}

} // namespace

TEST_CASE("Sampler combines every source into one snapshot", "[sampler]") {
    hostmon::testing::FakeCollector collector;
    collector.set_cpu_usage(42);
    collector.set_memory(850, 1000, 100, 400);
    collector.disk = 91;
    collector.temperature = 55;

    auto config = hostmon::testing::quiet_config();
    hostmon::Sampler sampler(collector, config);
    auto snapshot = sampler.sample();

    REQUIRE(snapshot.cpu_pct() == 42);
    REQUIRE(snapshot.ram_pct() == 85);
    REQUIRE(snapshot.swap_pct() == 25);
    REQUIRE(snapshot.disk_pct() == 91);
    REQUIRE(snapshot.temperature() == 55);
    REQUIRE(snapshot.unreadable().empty());
    REQUIRE(collector.cpu_read_count == 2);
}

TEST_CASE("Unreadable sources read as zero and are named", "[sampler]") {
    hostmon::testing::FakeCollector collector;
    collector.disk = std::nullopt;

    auto config = hostmon::testing::quiet_config();
    hostmon::Sampler sampler(collector, config);
    auto snapshot = sampler.sample();

    REQUIRE(snapshot.cpu_pct() == 0);
    REQUIRE(snapshot.ram_pct() == 0);
    REQUIRE(snapshot.swap_pct() == 0);
    REQUIRE(snapshot.disk_pct() == 0);
    REQUIRE_FALSE(snapshot.temperature().has_value());
    REQUIRE(names(snapshot, "cpu"));
    REQUIRE(names(snapshot, "memory"));
    REQUIRE(names(snapshot, "disk"));
    REQUIRE(names(snapshot, "temperature"));
}

TEST_CASE("Zero totals give zero percentages", "[sampler]") {
    hostmon::testing::FakeCollector collector;
    hostmon::CpuCounters frozen;
    frozen.user = 10;
    frozen.idle = 90;
    collector.cpu_reads = {frozen, frozen};
    collector.set_memory(0, 0);

    auto config = hostmon::testing::quiet_config();
    hostmon::Sampler sampler(collector, config);
    auto snapshot = sampler.sample();

    REQUIRE(snapshot.cpu_pct() == 0);
    REQUIRE(snapshot.ram_pct() == 0);
    REQUIRE(snapshot.swap_pct() == 0);
    REQUIRE(names(snapshot, "cpu"));
    REQUIRE_FALSE(names(snapshot, "memory"));
}

TEST_CASE("Snapshot clamps percentages", "[sampler]") {
    hostmon::Snapshot snapshot(130, -5, 100, 0, std::nullopt, std::chrono::system_clock::now());
    REQUIRE(snapshot.cpu_pct() == 100);
    REQUIRE(snapshot.ram_pct() == 0);
    REQUIRE(snapshot.swap_pct() == 100);
}
