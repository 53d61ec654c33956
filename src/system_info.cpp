#include "hostmon/system_info.hpp"
#include "hostmon/metrics_collector.hpp"
#include <deque>
#include <regex>
#include <sstream>

namespace hostmon {

std::optional<std::string> parse_default_route(std::istream& route_table) {
    std::string line;
    std::getline(route_table, line); // Skip header

    while (std::getline(route_table, line)) {
        std::istringstream iss(line);
        std::string iface, destination;
        if (!(iss >> iface >> destination)) continue;
        if (destination == "00000000") {
            return iface;
        }
    }
    return std::nullopt;
}

std::optional<NetworkTraffic> parse_net_dev(std::istream& net_dev, const std::string& interface_name) {
    std::string line;
    while (std::getline(net_dev, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (trim(line.substr(0, colon)) != interface_name) continue;

        // rx: bytes packets errs drop fifo frame compressed multicast, then tx bytes
        std::istringstream iss(line.substr(colon + 1));
        std::vector<std::string> fields;
        std::string field;
        while (iss >> field) fields.push_back(field);
        if (fields.size() < 9 || !is_numeric(fields[0]) || !is_numeric(fields[8])) {
            return std::nullopt;
        }

        NetworkTraffic traffic;
        traffic.interface_name = interface_name;
        traffic.bytes_received = std::stoull(fields[0]);
        traffic.bytes_sent = std::stoull(fields[8]);
        return traffic;
    }
    return std::nullopt;
}

int count_error_lines(const std::vector<std::string>& lines) {
    static const std::regex keywords("error|critical|fail|warn", std::regex::icase);
    int count = 0;
    for (const auto& line : lines) {
        if (std::regex_search(line, keywords)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> tail_lines(std::istream& in, std::size_t count) {
    std::deque<std::string> window;
    std::string line;
    while (std::getline(in, line)) {
        window.push_back(line);
        if (window.size() > count) {
            window.pop_front();
        }
    }
    return {window.begin(), window.end()};
}

std::optional<double> parse_uptime(std::istream& in) {
    std::string first;
    if (!(in >> first) || !is_decimal(first)) {
        return std::nullopt;
    }
    return std::stod(first);
}

std::string format_uptime(double seconds) {
    long long total_minutes = static_cast<long long>(seconds) / 60;
    long long weeks = total_minutes / (60 * 24 * 7);
    long long days = (total_minutes / (60 * 24)) % 7;
    long long hours = (total_minutes / 60) % 24;
    long long minutes = total_minutes % 60;

    std::ostringstream oss;
    oss << "up";
    bool first = true;
    auto part = [&](long long value, const char* unit) {
        if (value == 0) return;
        oss << (first ? " " : ", ") << value << " " << unit << (value == 1 ? "" : "s");
        first = false;
    };
    part(weeks, "week");
    part(days, "day");
    part(hours, "hour");
    part(minutes, "minute");
    if (first) {
        oss << " 0 minutes";
    }
    return oss.str();
}

} // namespace hostmon
