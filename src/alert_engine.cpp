#include "hostmon/alert_engine.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

namespace hostmon {

const char* to_string(AlertLevel level) {
    switch (level) {
        case AlertLevel::Warning:  return "warning";
        case AlertLevel::Critical: return "critical";
        default:                   return "info";
    }
}

const char* to_string(Metric metric) {
    switch (metric) {
        case Metric::Cpu:  return "CPU";
        case Metric::Ram:  return "RAM";
        case Metric::Disk: return "Disk";
        case Metric::Swap: return "Swap";
    }
    return "";
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

AlertEngine::AlertEngine(const ThresholdConfig& thresholds)
    : thresholds_(thresholds)
{
}

static std::optional<Alert> make_alert(Metric metric, AlertLevel level, int value, int limit,
                                       const char* title, const Snapshot& snapshot) {
    if (!AlertEngine::breached(value, limit)) {
        return std::nullopt;
    }

    Alert alert;
    alert.metric = metric;
    alert.level = level;
    alert.observed_value = value;
    alert.title = title;
    alert.timestamp = snapshot.timestamp();

    std::ostringstream oss;
    oss << to_string(metric) << " usage: " << value << "%";
    alert.message = oss.str();
    return alert;
}

std::optional<Alert> AlertEngine::check_cpu(const Snapshot& snapshot) const {
    return make_alert(Metric::Cpu, AlertLevel::Critical, snapshot.cpu_pct(),
                      thresholds_.cpu_limit, "High CPU load", snapshot);
}

std::optional<Alert> AlertEngine::check_ram(const Snapshot& snapshot) const {
    return make_alert(Metric::Ram, AlertLevel::Warning, snapshot.ram_pct(),
                      thresholds_.ram_limit, "High RAM usage", snapshot);
}

std::optional<Alert> AlertEngine::check_disk(const Snapshot& snapshot) const {
    return make_alert(Metric::Disk, AlertLevel::Critical, snapshot.disk_pct(),
                      thresholds_.disk_limit, "Low disk space", snapshot);
}

std::optional<Alert> AlertEngine::check_swap(const Snapshot& snapshot) const {
    return make_alert(Metric::Swap, AlertLevel::Warning, snapshot.swap_pct(),
                      thresholds_.swap_warn_limit, "Swap in use", snapshot);
}

std::vector<Alert> AlertEngine::evaluate(const Snapshot& snapshot) const {
    std::vector<Alert> alerts;

    for (auto check : {&AlertEngine::check_cpu, &AlertEngine::check_ram, &AlertEngine::check_disk}) {
        if (auto alert = (this->*check)(snapshot)) {
            alerts.push_back(*alert);
        }
    }

    return alerts;
}

} // namespace hostmon
