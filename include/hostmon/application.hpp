#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/metrics_collector.hpp"
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace hostmon {

// Wires command line, configuration, collector, sinks and the monitor loop
class Application {
public:
    using CollectorFactory = std::function<std::unique_ptr<MetricsCollector>(const MonitorConfig&)>;
    using DependencyCheck = std::function<std::vector<std::string>()>;

    // Real collector, real $PATH check; interactive when stdout is a terminal
    Application(std::ostream& out, std::ostream& err);

    Application(std::ostream& out, std::ostream& err,
                CollectorFactory factory, DependencyCheck dependency_check,
                bool interactive = false);

    // args excludes the program name; returns the process exit code
    int run(const std::vector<std::string>& args, const std::string& program_name = "hostmon");

private:
    bool load_config(const std::string& explicit_path, MonitorConfig& config);

    std::ostream& out_;
    std::ostream& err_;
    CollectorFactory factory_;
    DependencyCheck dependency_check_;
    bool interactive_;
};

} // namespace hostmon
