#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/system_monitor.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hostmon {

struct CommandLine {
    RunMode mode = RunMode::Snapshot;
    std::optional<int> interval;      // --continuous N
    bool show_help = false;
    bool debug = false;
    std::string config_path;          // --config PATH
};

// Positive integer seconds, digits only
bool parse_interval(const std::string& text, int& seconds);

// args excludes the program name. On failure error holds a user-facing message.
bool parse_command_line(const std::vector<std::string>& args, CommandLine& out, std::string& error);

void print_usage(std::ostream& out, const std::string& program_name, const MonitorConfig& config);

} // namespace hostmon
