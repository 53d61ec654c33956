#include "hostmon/application.hpp"
#include "hostmon/cancellation.hpp"
#include "hostmon/command_line.hpp"
#include "hostmon/command_runner.hpp"
#include "hostmon/display.hpp"
#include "hostmon/notification_sink.hpp"
#include "hostmon/system_monitor.hpp"
#include <unistd.h>

namespace hostmon {

Application::Application(std::ostream& out, std::ostream& err)
    : Application(out, err,
                  [](const MonitorConfig& config) { return create_metrics_collector(config); },
                  [] { return check_dependencies(required_utilities()); },
                  ::isatty(STDOUT_FILENO) != 0)
{
}

Application::Application(std::ostream& out, std::ostream& err,
                         CollectorFactory factory, DependencyCheck dependency_check,
                         bool interactive)
    : out_(out)
    , err_(err)
    , factory_(std::move(factory))
    , dependency_check_(std::move(dependency_check))
    , interactive_(interactive)
{
}

bool Application::load_config(const std::string& explicit_path, MonitorConfig& config) {
    std::string path = explicit_path;
    if (path.empty()) {
        auto fallback = ConfigManager::default_config_path();
        if (!fallback) {
            config = MonitorConfig{};
            return true;
        }
        path = *fallback;
    }

    ConfigManager manager(path);
    if (!manager.load()) {
        err_ << "Failed to load configuration from " << path << "\n";
        return false;
    }

    std::string validation_error;
    if (!manager.validate_config(validation_error)) {
        err_ << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    config = manager.get_config();
    DebugLogger::log("configuration version ", config.version, " loaded from ", path);
    return true;
}

int Application::run(const std::vector<std::string>& args, const std::string& program_name) {
    CommandLine cmd;
    std::string error;
    if (!parse_command_line(args, cmd, error)) {
        err_ << "Error: " << error << "\n";
        err_ << "Run '" << program_name << " --help' for usage.\n";
        return 1;
    }
    if (cmd.debug) {
        DebugLogger::set_enabled(true);
    }

    MonitorConfig config;
    bool loaded = load_config(cmd.config_path, config);

    // Help exits 0 even when the configuration is unusable
    if (cmd.show_help) {
        if (!loaded) {
            err_ << "Warning: showing built-in defaults\n";
            config = MonitorConfig{};
        }
        print_usage(out_, program_name, config);
        return 0;
    }
    if (!loaded) {
        return 1;
    }
    if (config.debug_logging) {
        DebugLogger::set_enabled(true);
    }

    auto missing = dependency_check_();
    if (!missing.empty()) {
        err_ << "Error: required commands are missing:\n";
        for (const auto& name : missing) {
            err_ << "  " << name << "\n";
        }
        return 1;
    }

    auto collector = factory_(config);
    if (!collector) {
        err_ << "Failed to initialize metrics collector\n";
        return 1;
    }

    AlertDispatcher dispatcher = make_dispatcher(config.alerts, out_, interactive_);
    Display display(config, out_, interactive_);
    SystemMonitor monitor(config, *collector, dispatcher, display, out_);

    auto interval = std::chrono::seconds(cmd.interval.value_or(config.interval));
    CancellationToken token;

    if (cmd.mode == RunMode::Continuous) {
        SignalWatcher watcher(token);
        return monitor.run(cmd.mode, interval, token);
    }
    return monitor.run(cmd.mode, interval, token);
}

} // namespace hostmon
