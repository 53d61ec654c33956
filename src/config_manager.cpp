#include "hostmon/config_manager.hpp"
#include "hostmon/metrics_collector.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <cctype>

// Minimal YAML subset: top-level scalars and one level of sections
namespace hostmon {

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string default_log_path() {
    return expand_home("~/.system_monitor.log");
}

bool MonitorConfig::validate(std::string& error_msg) const {
    if (interval <= 0) {
        error_msg = "interval must be a positive number of seconds";
        return false;
    }

    if (cpu_sample_ms < 0) {
        error_msg = "cpu_sample_ms must not be negative";
        return false;
    }

    if (!thresholds.validate()) {
        error_msg = "Thresholds invalid: every limit must be within 0-100";
        return false;
    }

    if (alerts.log_to_file && alerts.log_path.empty()) {
        error_msg = "alerts.log_path is empty while log_to_file is enabled";
        return false;
    }

    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
{
}

std::optional<std::string> ConfigManager::default_config_path() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return std::nullopt;
    }

    auto candidate = base / "hostmon" / "config.yaml";
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
        return std::nullopt;
    }
    return candidate.string();
}

// Helper to parse int value from string
static bool parse_int(const std::string& value, int& out) {
    std::string digits = value;
    bool negative = false;
    if (!digits.empty() && digits[0] == '-') {
        negative = true;
        digits = digits.substr(1);
    }
    if (!is_numeric(digits) || digits.size() > 9) {
        return false;
    }
    out = std::stoi(digits) * (negative ? -1 : 1);
    return true;
}

// Helper to parse bool value from string
static bool parse_bool(const std::string& value, bool& out) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true" || lower == "yes" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    // Reset config to defaults
    config_ = MonitorConfig{};

    std::string raw;
    std::string current_section;
    int line_no = 0;

    while (std::getline(file, raw)) {
        ++line_no;
        size_t indent = raw.find_first_not_of(' ');
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            std::cerr << config_path_ << ":" << line_no << ": expected 'key: value'\n";
            return false;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Strip trailing comment from unquoted values
        if (!value.empty() && value.front() != '"') {
            size_t hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        // Remove quotes from string values
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        // Section header (no indent, no value)
        if (indent == 0 && value.empty()) {
            current_section = key;
            continue;
        }
        if (indent == 0) {
            current_section.clear();
        }

        bool ok = true;
        if (current_section.empty()) {
            if (key == "version") config_.version = value;
            else if (key == "interval") ok = parse_int(value, config_.interval);
            else if (key == "cpu_sample_ms") ok = parse_int(value, config_.cpu_sample_ms);
            else if (key == "debug_logging") ok = parse_bool(value, config_.debug_logging);
        }
        else if (current_section == "thresholds") {
            if (key == "cpu_limit") ok = parse_int(value, config_.thresholds.cpu_limit);
            else if (key == "ram_limit") ok = parse_int(value, config_.thresholds.ram_limit);
            else if (key == "disk_limit") ok = parse_int(value, config_.thresholds.disk_limit);
            else if (key == "swap_warn_limit") ok = parse_int(value, config_.thresholds.swap_warn_limit);
        }
        else if (current_section == "alerts") {
            if (key == "log_to_file") ok = parse_bool(value, config_.alerts.log_to_file);
            else if (key == "log_path") config_.alerts.log_path = expand_home(value);
            else if (key == "console") ok = parse_bool(value, config_.alerts.console);
            else if (key == "desktop") ok = parse_bool(value, config_.alerts.desktop);
            else if (key == "dispatch_swap") ok = parse_bool(value, config_.alerts.dispatch_swap);
        }
        else if (current_section == "sources") {
            if (key == "proc_root") config_.sources.proc_root = value;
            else if (key == "thermal_zone") config_.sources.thermal_zone = value;
            else if (key == "sensors_command") config_.sources.sensors_command = value;
            else if (key == "syslog") config_.sources.syslog = value;
            else if (key == "root_mount") config_.sources.root_mount = value;
        }
        else if (current_section == "display") {
            if (key == "color") ok = parse_bool(value, config_.display.color);
            else if (key == "show_bars") ok = parse_bool(value, config_.display.show_bars);
            else if (key == "clear_screen") ok = parse_bool(value, config_.display.clear_screen);
        }

        if (!ok) {
            std::cerr << config_path_ << ":" << line_no << ": invalid value for '"
                      << key << "': " << value << "\n";
            return false;
        }
        DebugLogger::log("config ", current_section.empty() ? "" : current_section + ".", key, " = ", value);
    }

    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    return config_.validate(error_msg);
}

} // namespace hostmon
