#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <istream>

namespace hostmon {

struct NetworkTraffic {
    std::string interface_name;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
};

// Auxiliary counts shown below the resource report
struct SystemInfo {
    std::string hostname;
    std::optional<double> uptime_seconds;
    std::optional<int> process_count;
    std::optional<NetworkTraffic> traffic;   // default-route interface only
    std::optional<int> syslog_errors;        // unset when the log is unreadable
};

constexpr std::size_t kSyslogTailLines = 30;

// Interface carrying the 0.0.0.0 destination in /proc/net/route
std::optional<std::string> parse_default_route(std::istream& route_table);

std::optional<NetworkTraffic> parse_net_dev(std::istream& net_dev, const std::string& interface_name);

// Lines matching error|critical|fail|warn, case-insensitive
int count_error_lines(const std::vector<std::string>& lines);

std::vector<std::string> tail_lines(std::istream& in, std::size_t count);

std::optional<double> parse_uptime(std::istream& in);

// "up 3 days, 2 hours, 5 minutes" in the style of uptime -p
std::string format_uptime(double seconds);

} // namespace hostmon
