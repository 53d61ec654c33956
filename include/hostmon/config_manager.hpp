#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <optional>

namespace hostmon {

std::string default_log_path();

// Replace a leading "~" with $HOME
std::string expand_home(const std::string& path);

struct ThresholdConfig {
    int cpu_limit = 80;
    int ram_limit = 85;
    int disk_limit = 90;
    int swap_warn_limit = 50;

    bool validate() const {
        auto in_range = [](int v) { return v >= 0 && v <= 100; };
        return in_range(cpu_limit) && in_range(ram_limit) &&
               in_range(disk_limit) && in_range(swap_warn_limit);
    }

    TYPICONF_DEFINE_FIELDS(ThresholdConfig,
        TYPICONF_FIELD(cpu_limit),
        TYPICONF_FIELD(ram_limit),
        TYPICONF_FIELD(disk_limit),
        TYPICONF_FIELD(swap_warn_limit)
    )
};

struct AlertConfig {
    bool log_to_file = true;
    std::string log_path = default_log_path();
    bool console = true;
    bool desktop = true;
    bool dispatch_swap = false;   // swap breaches only tag the report unless set

    TYPICONF_DEFINE_FIELDS(AlertConfig,
        TYPICONF_FIELD(log_to_file),
        TYPICONF_FIELD(log_path),
        TYPICONF_FIELD(console),
        TYPICONF_FIELD(desktop),
        TYPICONF_FIELD(dispatch_swap)
    )
};

struct SourceConfig {
    std::string proc_root = "/proc";
    std::string thermal_zone = "/sys/class/thermal/thermal_zone0/temp";
    std::string sensors_command = "sensors";
    std::string syslog = "/var/log/syslog";
    std::string root_mount = "/";

    TYPICONF_DEFINE_FIELDS(SourceConfig,
        TYPICONF_FIELD(proc_root),
        TYPICONF_FIELD(thermal_zone),
        TYPICONF_FIELD(sensors_command),
        TYPICONF_FIELD(syslog),
        TYPICONF_FIELD(root_mount)
    )
};

struct DisplayConfig {
    bool color = true;
    bool show_bars = true;
    bool clear_screen = true;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(color),
        TYPICONF_FIELD(show_bars),
        TYPICONF_FIELD(clear_screen)
    )
};

struct MonitorConfig {
    std::string version = "1.0";
    int interval = 60;            // seconds between continuous-mode cycles
    int cpu_sample_ms = 1000;     // window between the two /proc/stat reads
    bool debug_logging = false;
    ThresholdConfig thresholds;
    AlertConfig alerts;
    SourceConfig sources;
    DisplayConfig display;

    // On failure error_msg names the offending setting
    bool validate(std::string& error_msg) const;

    TYPICONF_DEFINE_FIELDS(MonitorConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(interval),
        TYPICONF_FIELD(cpu_sample_ms),
        TYPICONF_FIELD(debug_logging),
        TYPICONF_FIELD(thresholds),
        TYPICONF_FIELD(alerts),
        TYPICONF_FIELD(sources),
        TYPICONF_FIELD(display)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // $XDG_CONFIG_HOME/hostmon/config.yaml or ~/.config/hostmon/config.yaml, if present
    static std::optional<std::string> default_config_path();

    // Load configuration
    bool load();

    // Access configuration
    const MonitorConfig& get_config() const { return config_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    MonitorConfig config_;
};

} // namespace hostmon
