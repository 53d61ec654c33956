#include "hostmon/metrics_collector.hpp"
#include "hostmon/config_manager.hpp"
#include "hostmon/command_runner.hpp"
#include "hostmon/process_ranker.hpp"
#include "hostmon/temperature.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/statvfs.h>
#include <unistd.h>
#include <climits>

namespace hostmon {

class LinuxMetricsCollector : public MetricsCollector {
public:
    explicit LinuxMetricsCollector(const MonitorConfig& config)
        : proc_root_(config.sources.proc_root)
        , syslog_path_(config.sources.syslog)
        , temperature_chain_(default_temperature_chain(config.sources))
    {
    }

    std::optional<CpuCounters> read_cpu_counters() override {
        std::ifstream stat_file(proc_root_ / "stat");
        std::string line;
        while (std::getline(stat_file, line)) {
            if (line.rfind("cpu ", 0) == 0) {
                return parse_cpu_line(line);
            }
        }
        DebugLogger::log("no aggregate cpu line in ", (proc_root_ / "stat").string());
        return std::nullopt;
    }

    std::optional<MemoryMetrics> read_memory() override {
        std::ifstream meminfo(proc_root_ / "meminfo");
        if (!meminfo) {
            return std::nullopt;
        }
        return parse_meminfo(meminfo);
    }

    std::optional<int> read_disk_usage(const std::string& mount_point) override {
        struct statvfs stat;
        if (statvfs(mount_point.c_str(), &stat) != 0) {
            DebugLogger::log("statvfs failed for ", mount_point);
            return std::nullopt;
        }
        return disk_percent(stat.f_blocks - stat.f_bfree, stat.f_bavail);
    }

    std::optional<int> read_temperature() override {
        return resolve_temperature(temperature_chain_);
    }

    std::optional<std::vector<std::string>> list_processes(SortKey key) override {
        std::string command = std::string("LC_ALL=C ps aux --sort=-") + sort_field(key) + " 2>/dev/null";
        auto output = run_command(command);
        if (!output) {
            return std::nullopt;
        }
        return split_lines(*output);
    }

    SystemInfo collect_system_info() override {
        SystemInfo info;
        info.hostname = read_hostname();

        std::ifstream uptime(proc_root_ / "uptime");
        if (uptime) {
            info.uptime_seconds = parse_uptime(uptime);
        }

        info.process_count = count_processes();
        info.traffic = read_default_route_traffic();

        std::ifstream syslog(syslog_path_);
        if (syslog) {
            info.syslog_errors = count_error_lines(tail_lines(syslog, kSyslogTailLines));
        }
        return info;
    }

private:
    static std::string read_hostname() {
        char name[HOST_NAME_MAX + 1] = {0};
        if (gethostname(name, sizeof(name) - 1) != 0) {
            return "N/A";
        }
        return name;
    }

    std::optional<int> count_processes() const {
        std::error_code ec;
        std::filesystem::directory_iterator it(proc_root_, ec);
        if (ec) {
            return std::nullopt;
        }
        int count = 0;
        for (const auto& entry : it) {
            if (is_numeric(entry.path().filename().string())) {
                ++count;
            }
        }
        return count;
    }

    std::optional<NetworkTraffic> read_default_route_traffic() const {
        std::ifstream route(proc_root_ / "net" / "route");
        if (!route) {
            return std::nullopt;
        }
        auto iface = parse_default_route(route);
        if (!iface) {
            return std::nullopt;
        }
        std::ifstream net_dev(proc_root_ / "net" / "dev");
        return parse_net_dev(net_dev, *iface);
    }

    std::filesystem::path proc_root_;
    std::string syslog_path_;
    std::vector<TemperatureSource> temperature_chain_;
};

std::unique_ptr<MetricsCollector> create_linux_metrics_collector(const MonitorConfig& config) {
    return std::make_unique<LinuxMetricsCollector>(config);
}

} // namespace hostmon
