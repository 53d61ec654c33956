#include "hostmon/command_line.hpp"
#include "hostmon/metrics_collector.hpp"

namespace hostmon {

bool parse_interval(const std::string& text, int& seconds) {
    if (!is_numeric(text) || text.size() > 9) {
        return false;
    }
    int value = std::stoi(text);
    if (value < 1) {
        return false;
    }
    seconds = value;
    return true;
}

bool parse_command_line(const std::vector<std::string>& args, CommandLine& out, std::string& error) {
    CommandLine cmd;
    bool mode_seen = false;

    auto set_mode = [&](RunMode mode, const std::string& option) {
        if (mode_seen) {
            error = "option " + option + " conflicts with an earlier mode option";
            return false;
        }
        mode_seen = true;
        cmd.mode = mode;
        return true;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cmd.show_help = true;
        } else if (arg == "--debug") {
            cmd.debug = true;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config requires a file path";
                return false;
            }
            cmd.config_path = args[++i];
        } else if (arg == "--continuous" || arg == "--c") {
            if (!set_mode(RunMode::Continuous, arg)) return false;
            // A following token that is not a long option is the interval
            if (i + 1 < args.size() && args[i + 1].rfind("--", 0) != 0) {
                const std::string& value = args[++i];
                int seconds = 0;
                if (!parse_interval(value, seconds)) {
                    error = "invalid interval: " + value;
                    return false;
                }
                cmd.interval = seconds;
            }
        } else if (arg == "--log" || arg == "--l") {
            if (!set_mode(RunMode::LogOnly, arg)) return false;
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }

    out = cmd;
    return true;
}

void print_usage(std::ostream& out, const std::string& program_name, const MonitorConfig& config) {
    out << "Usage: " << program_name << " [options]\n";
    out << "\n";
    out << "Options:\n";
    out << "  (no options)         Show the report once\n";
    out << "  --continuous [N]     Refresh the report every N seconds (default " << config.interval << ")\n";
    out << "  --c [N]              Same as --continuous\n";
    out << "  --log, --l           Check thresholds and log alerts only, no report\n";
    out << "  --config PATH        Read settings from PATH\n";
    out << "  --debug              Print diagnostics to stderr\n";
    out << "  -h, --help           Show this help message\n";
    out << "\n";
    out << "Thresholds:\n";
    out << "  CPU:  " << config.thresholds.cpu_limit << "%\n";
    out << "  RAM:  " << config.thresholds.ram_limit << "%\n";
    out << "  Disk: " << config.thresholds.disk_limit << "%\n";
    out << "  Swap: " << config.thresholds.swap_warn_limit << "% (informational)\n";
    out << "\n";
    out << "Log file: " << (config.alerts.log_to_file ? config.alerts.log_path : std::string("disabled")) << "\n";
}

} // namespace hostmon
