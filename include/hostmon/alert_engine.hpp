#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/sampler.hpp"
#include <vector>
#include <chrono>
#include <optional>
#include <string>

namespace hostmon {

enum class AlertLevel {
    Normal,
    Warning,
    Critical
};

enum class Metric {
    Cpu,
    Ram,
    Disk,
    Swap
};

struct Alert {
    Metric metric;
    AlertLevel level;
    int observed_value;
    std::string title;       // "High CPU load"
    std::string message;     // "CPU usage: 92%"
    std::chrono::system_clock::time_point timestamp;
};

const char* to_string(AlertLevel level);
const char* to_string(Metric metric);

std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

class AlertEngine {
public:
    explicit AlertEngine(const ThresholdConfig& thresholds);

    // CPU, RAM and disk in that order, each checked independently
    std::vector<Alert> evaluate(const Snapshot& snapshot) const;

    std::optional<Alert> check_cpu(const Snapshot& snapshot) const;
    std::optional<Alert> check_ram(const Snapshot& snapshot) const;
    std::optional<Alert> check_disk(const Snapshot& snapshot) const;

    // Informational; always Warning however far above the limit
    std::optional<Alert> check_swap(const Snapshot& snapshot) const;

    static bool breached(int value, int limit) { return value > limit; }

private:
    ThresholdConfig thresholds_;
};

} // namespace hostmon
