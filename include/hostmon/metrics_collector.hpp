#pragma once

#include "hostmon/system_info.hpp"
#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <istream>
#include <iostream>

namespace hostmon {

struct MonitorConfig;
enum class SortKey;

class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            std::cerr << "[DEBUG] ";
            ((std::cerr << args), ...);
            std::cerr << std::endl;
        }
    }

private:
    static bool enabled_;
};

// Cumulative jiffies from the aggregate "cpu" line of /proc/stat
struct CpuCounters {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }
    uint64_t idle_total() const { return idle + iowait; }
};

struct UsagePair {
    uint64_t total_kb = 0;
    uint64_t used_kb = 0;
};

struct MemoryMetrics {
    UsagePair ram;
    UsagePair swap;
};

class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    // Every reader returns std::nullopt when its source is missing or not numeric
    virtual std::optional<CpuCounters> read_cpu_counters() = 0;
    virtual std::optional<MemoryMetrics> read_memory() = 0;
    virtual std::optional<int> read_disk_usage(const std::string& mount_point) = 0;
    virtual std::optional<int> read_temperature() = 0;

    // Raw process table rows, header included, ordered by the OS listing
    virtual std::optional<std::vector<std::string>> list_processes(SortKey key) = 0;

    virtual SystemInfo collect_system_info() = 0;
};

// Factory function
std::unique_ptr<MetricsCollector> create_metrics_collector(const MonitorConfig& config);

// Parsing and arithmetic shared by the platform readers
bool is_numeric(const std::string& text);
bool is_decimal(const std::string& text);
std::string trim(const std::string& str);

std::optional<CpuCounters> parse_cpu_line(const std::string& line);
std::optional<MemoryMetrics> parse_meminfo(std::istream& in);

int clamp_percent(long long value);
int percent_of(uint64_t used, uint64_t total);
int compute_cpu_usage(const CpuCounters& before, const CpuCounters& after);
int disk_percent(uint64_t used_blocks, uint64_t available_blocks);

} // namespace hostmon
