#include "hostmon/display.hpp"
#include "hostmon/temperature.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

namespace hostmon {

namespace {

constexpr const char* kBlue = "\033[0;34m";
constexpr const char* kYellow = "\033[1;33m";
constexpr const char* kRule = "================================";

} // namespace

Display::Display(const MonitorConfig& config, std::ostream& out, bool interactive)
    : out_(out)
    , thresholds_(config.thresholds)
    , config_(config.display)
    , interactive_(interactive)
    , use_color_(interactive && config.display.color)
    , syslog_path_(config.sources.syslog)
{
}

std::string Display::color_code(AlertLevel level) {
    if (!use_color_) {
        return "";
    }

    switch (level) {
        case AlertLevel::Normal:   return "\033[0;32m";  // Green
        case AlertLevel::Warning:  return kYellow;
        case AlertLevel::Critical: return "\033[0;31m";  // Red
        default:                   return "\033[0m";     // Reset
    }
}

std::string Display::highlight_code(RowHighlight highlight) {
    if (!use_color_) {
        return "";
    }

    switch (highlight) {
        case RowHighlight::Critical: return "\033[1;31m";
        case RowHighlight::Elevated: return "\033[1;33m";
        default:                     return "\033[0;32m";
    }
}

std::string Display::reset_color() {
    if (!use_color_) {
        return "";
    }
    return "\033[0m";
}

std::string Display::colorize(const std::string& text, AlertLevel level) {
    return color_code(level) + text + reset_color();
}

void Display::clear_screen() {
    if (!config_.clear_screen || !interactive_) {
        return;
    }
    out_ << "\033[2J\033[H" << std::flush;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string Display::create_progress_bar(int percentage, int width, AlertLevel level) {
    int filled = percentage * width / 100;
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return colorize(bar, level);
}

void Display::render_banner(const std::string& title) {
    std::string open = use_color_ ? kBlue : "";
    out_ << open << kRule << reset_color() << "\n";
    out_ << open << "    " << title << reset_color() << "\n";
    out_ << open << kRule << reset_color() << "\n";
}

void Display::render_header(const Snapshot& snapshot, const SystemInfo& info) {
    render_banner("SYSTEM MONITOR");
    out_ << "\n";

    auto time_t = std::chrono::system_clock::to_time_t(snapshot.timestamp());
    std::tm tm;
    localtime_r(&time_t, &tm);

    out_ << colorize("Host:", AlertLevel::Normal) << " " << info.hostname << "\n";
    out_ << colorize("Time:", AlertLevel::Normal) << " " << std::put_time(&tm, "%a %b %e %H:%M:%S %Z %Y") << "\n";
    out_ << colorize("Uptime:", AlertLevel::Normal) << " "
         << (info.uptime_seconds ? format_uptime(*info.uptime_seconds) : std::string("N/A")) << "\n\n";
}

void Display::render_metric(const std::string& label, int value, AlertLevel level, const std::string& tag) {
    out_ << colorize(label, level) << " ";
    if (config_.show_bars) {
        out_ << create_progress_bar(value, 20, level) << "  ";
    }
    out_ << std::setw(3) << value << "%";
    if (level != AlertLevel::Normal) {
        out_ << " " << colorize("[" + tag + "]", level);
    }
    out_ << "\n";
}

void Display::render_resources(const Snapshot& snapshot) {
    out_ << colorize("=== Resource usage ===", AlertLevel::Warning) << "\n";

    auto level_for = [](int value, int limit, AlertLevel breach) {
        return AlertEngine::breached(value, limit) ? breach : AlertLevel::Normal;
    };

    render_metric("CPU: ", snapshot.cpu_pct(),
                  level_for(snapshot.cpu_pct(), thresholds_.cpu_limit, AlertLevel::Critical), "HIGH LOAD");
    render_metric("RAM: ", snapshot.ram_pct(),
                  level_for(snapshot.ram_pct(), thresholds_.ram_limit, AlertLevel::Critical), "HIGH USAGE");
    render_metric("Disk:", snapshot.disk_pct(),
                  level_for(snapshot.disk_pct(), thresholds_.disk_limit, AlertLevel::Critical), "LOW SPACE");
    render_metric("Swap:", snapshot.swap_pct(),
                  level_for(snapshot.swap_pct(), thresholds_.swap_warn_limit, AlertLevel::Warning), "ACTIVE");

    out_ << colorize("Temperature:", AlertLevel::Normal) << " " << format_temperature(snapshot.temperature()) << "\n";
}

void Display::render_processes(const std::vector<ProcessEntry>& rows, SortKey key, const std::string& title) {
    std::string blue = use_color_ ? kBlue : "";

    out_ << colorize("=== Top " + std::to_string(ProcessRanker::kTopCount) + " processes by " + title + " ===",
                     AlertLevel::Warning) << "\n\n";

    out_ << blue << std::left
         << std::setw(10) << "USER" << " " << std::setw(8) << "PID" << " "
         << std::setw(8) << sort_field(key) << " " << std::setw(10) << "VSZ (MB)" << " "
         << std::setw(12) << "RSS (MB)" << " " << "COMMAND" << reset_color() << "\n";
    out_ << blue
         << std::string(10, '-') << " " << std::string(8, '-') << " " << std::string(8, '-') << " "
         << std::string(10, '-') << " " << std::string(12, '-') << " " << std::string(kCommandWidth, '-')
         << reset_color() << "\n";

    for (const auto& row : rows) {
        std::ostringstream value;
        if (key == SortKey::Rss) {
            value << row.rss_mb;
        } else {
            value << std::fixed << std::setprecision(1) << sort_value(row, key);
        }

        out_ << std::left
             << std::setw(10) << row.user << " " << std::setw(8) << row.pid << " "
             << highlight_code(row.highlight) << std::setw(8) << value.str() << reset_color() << " "
             << std::setw(10) << row.vsz_mb << " " << std::setw(12) << row.rss_mb << " "
             << row.command << "\n";
    }
    out_ << std::right << "\n";
}

void Display::render_additional(const SystemInfo& info) {
    render_banner("Additional information");

    out_ << colorize("Active processes:", AlertLevel::Normal) << " "
         << (info.process_count ? std::to_string(*info.process_count) : std::string("N/A")) << "\n";

    if (info.traffic) {
        out_ << colorize("Traffic (" + info.traffic->interface_name + "):", AlertLevel::Normal) << "\n";
        out_ << "  In: " << format_bytes(info.traffic->bytes_received)
             << "   Out: " << format_bytes(info.traffic->bytes_sent) << "\n";
    }

    if (info.syslog_errors && *info.syslog_errors > 0) {
        out_ << colorize("Errors in " + syslog_path_ + ":", AlertLevel::Critical) << " "
             << *info.syslog_errors << " (last " << kSyslogTailLines << " lines)\n";
    }
}

void Display::render(const Snapshot& snapshot,
                     const std::vector<ProcessEntry>& top_cpu,
                     const std::vector<ProcessEntry>& top_mem,
                     const SystemInfo& info)
{
    render_header(snapshot, info);
    render_resources(snapshot);
    out_ << "\n";
    render_processes(top_cpu, SortKey::Cpu, "CPU");
    render_processes(top_mem, SortKey::Mem, "RAM");
    render_additional(info);
    out_ << std::flush;
}

} // namespace hostmon
