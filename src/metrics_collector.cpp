#include "hostmon/metrics_collector.hpp"
#include <algorithm>
#include <sstream>

namespace hostmon {

// Initialize static member
bool DebugLogger::enabled_ = false;

// Platform-specific implementations are in platform/ subdirectory
#ifdef __linux__
    std::unique_ptr<MetricsCollector> create_metrics_collector(const MonitorConfig& config) {
        extern std::unique_ptr<MetricsCollector> create_linux_metrics_collector(const MonitorConfig& config);
        return create_linux_metrics_collector(config);
    }
#else
    #error "Unsupported platform"
#endif

bool is_numeric(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
}

bool is_decimal(const std::string& text) {
    size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return is_numeric(text);
    }
    std::string whole = text.substr(0, dot);
    std::string frac = text.substr(dot + 1);
    return (is_numeric(whole) || whole.empty()) && is_numeric(frac);
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::optional<CpuCounters> parse_cpu_line(const std::string& line) {
    std::istringstream iss(line);
    std::string label;
    iss >> label;
    if (label != "cpu") {
        return std::nullopt;
    }

    uint64_t* fields[8];
    CpuCounters counters;
    fields[0] = &counters.user;
    fields[1] = &counters.nice;
    fields[2] = &counters.system;
    fields[3] = &counters.idle;
    fields[4] = &counters.iowait;
    fields[5] = &counters.irq;
    fields[6] = &counters.softirq;
    fields[7] = &counters.steal;

    for (auto* field : fields) {
        std::string token;
        if (!(iss >> token) || !is_numeric(token) || token.size() > 19) {
            return std::nullopt;
        }
        *field = std::stoull(token);
    }
    return counters;
}

std::optional<MemoryMetrics> parse_meminfo(std::istream& in) {
    std::optional<uint64_t> mem_total, mem_available, mem_free, buffers, cached;
    std::optional<uint64_t> swap_total, swap_free;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string key;
        std::string value;
        iss >> key >> value;
        if (!is_numeric(value) || value.size() > 19) {
            continue;
        }
        uint64_t kb = std::stoull(value);

        if (key == "MemTotal:") mem_total = kb;
        else if (key == "MemAvailable:") mem_available = kb;
        else if (key == "MemFree:") mem_free = kb;
        else if (key == "Buffers:") buffers = kb;
        else if (key == "Cached:") cached = kb;
        else if (key == "SwapTotal:") swap_total = kb;
        else if (key == "SwapFree:") swap_free = kb;
    }

    if (!mem_total) {
        return std::nullopt;
    }

    MemoryMetrics metrics;
    metrics.ram.total_kb = *mem_total;

    // Kernels before 3.14 have no MemAvailable
    uint64_t reclaimable = mem_available ? *mem_available
                                         : mem_free.value_or(0) + buffers.value_or(0) + cached.value_or(0);
    metrics.ram.used_kb = *mem_total > reclaimable ? *mem_total - reclaimable : 0;

    metrics.swap.total_kb = swap_total.value_or(0);
    uint64_t free_swap = swap_free.value_or(metrics.swap.total_kb);
    metrics.swap.used_kb = metrics.swap.total_kb > free_swap ? metrics.swap.total_kb - free_swap : 0;

    return metrics;
}

int clamp_percent(long long value) {
    return static_cast<int>(std::clamp<long long>(value, 0, 100));
}

int percent_of(uint64_t used, uint64_t total) {
    if (total == 0) {
        return 0;
    }
    // Round half up
    long double ratio = static_cast<long double>(used) * 100.0L / static_cast<long double>(total);
    return clamp_percent(static_cast<long long>(ratio + 0.5L));
}

int compute_cpu_usage(const CpuCounters& before, const CpuCounters& after) {
    if (after.total() <= before.total()) {
        return 0;
    }
    uint64_t total_delta = after.total() - before.total();
    uint64_t idle_delta = after.idle_total() > before.idle_total()
                              ? after.idle_total() - before.idle_total()
                              : 0;
    return clamp_percent(100 - percent_of(idle_delta, total_delta));
}

int disk_percent(uint64_t used_blocks, uint64_t available_blocks) {
    uint64_t denominator = used_blocks + available_blocks;
    if (denominator == 0) {
        return 0;
    }
    // df rounds up
    long double ratio = static_cast<long double>(used_blocks) * 100.0L / static_cast<long double>(denominator);
    long long whole = static_cast<long long>(ratio);
    if (static_cast<long double>(whole) < ratio) {
        ++whole;
    }
    return clamp_percent(whole);
}

} // namespace hostmon
