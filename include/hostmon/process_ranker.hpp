#pragma once

#include "hostmon/metrics_collector.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hostmon {

enum class SortKey {
    Cpu,
    Mem,
    Rss
};

// Presentation only; never feeds the alert engine
enum class RowHighlight {
    Normal,
    Elevated,
    Critical
};

struct ProcessEntry {
    std::string user;
    int pid = 0;
    double cpu_pct = 0.0;
    double mem_pct = 0.0;
    uint64_t vsz_mb = 0;
    uint64_t rss_mb = 0;
    std::string command;
    RowHighlight highlight = RowHighlight::Normal;
};

constexpr std::size_t kCommandWidth = 50;
constexpr const char* kNoCommand = "<none>";

// ps --sort field name: "%cpu", "%mem" or "rss"
const char* sort_field(SortKey key);

// Longer than 50 characters becomes 47 characters plus "..."; empty becomes <none>
std::string truncate_command(const std::string& command);

// One `ps aux` row: USER PID %CPU %MEM VSZ RSS TTY STAT START TIME COMMAND...
std::optional<ProcessEntry> parse_process_row(const std::string& line);

RowHighlight classify_row(const ProcessEntry& entry, SortKey key);

double sort_value(const ProcessEntry& entry, SortKey key);

class ProcessRanker {
public:
    static constexpr std::size_t kTopCount = 5;

    explicit ProcessRanker(MetricsCollector& collector);

    // Fresh read of the process table; empty when it cannot be listed
    std::vector<ProcessEntry> top(SortKey key) const;

    // Drops the header row, keeps the highest kTopCount rows by key
    static std::vector<ProcessEntry> rank(const std::vector<std::string>& table, SortKey key);

private:
    MetricsCollector& collector_;
};

} // namespace hostmon
