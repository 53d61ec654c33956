#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/metrics_collector.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hostmon {

// One consistent set of measurements. Percentages are clamped to [0,100];
// an unreadable source leaves 0 (or no temperature) and is named in unreadable().
class Snapshot {
public:
    Snapshot(int cpu_pct, int ram_pct, int swap_pct, int disk_pct,
             std::optional<int> temperature,
             std::chrono::system_clock::time_point timestamp,
             std::vector<std::string> unreadable = {});

    int cpu_pct() const { return cpu_pct_; }
    int ram_pct() const { return ram_pct_; }
    int swap_pct() const { return swap_pct_; }
    int disk_pct() const { return disk_pct_; }
    const std::optional<int>& temperature() const { return temperature_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }
    const std::vector<std::string>& unreadable() const { return unreadable_; }

private:
    int cpu_pct_;
    int ram_pct_;
    int swap_pct_;
    int disk_pct_;
    std::optional<int> temperature_;
    std::chrono::system_clock::time_point timestamp_;
    std::vector<std::string> unreadable_;
};

class Sampler {
public:
    Sampler(MetricsCollector& collector, const MonitorConfig& config);

    // Blocks for the CPU sampling window
    Snapshot sample();

private:
    int sample_cpu(std::vector<std::string>& unreadable);

    MetricsCollector& collector_;
    std::string root_mount_;
    std::chrono::milliseconds cpu_window_;
};

} // namespace hostmon
