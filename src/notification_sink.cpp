#include "hostmon/notification_sink.hpp"
#include "hostmon/command_runner.hpp"
#include "hostmon/metrics_collector.hpp"
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>

namespace hostmon {

ConsoleSink::ConsoleSink(std::ostream& out, bool use_color)
    : out_(out)
    , use_color_(use_color)
{
}

void ConsoleSink::deliver(const Alert& alert) {
    const char* color = "";
    const char* label = "[INFO]";
    switch (alert.level) {
        case AlertLevel::Critical: color = "\033[0;31m"; label = "[CRITICAL]"; break;
        case AlertLevel::Warning:  color = "\033[1;33m"; label = "[WARNING]";  break;
        default:                   color = "\033[0;32m"; break;
    }

    if (use_color_) out_ << color;
    out_ << label << " " << alert.title << ": " << alert.message;
    if (use_color_) out_ << "\033[0m";
    out_ << "\n";
}

LogSink::LogSink(std::string path)
    : path_(std::move(path))
{
}

std::string LogSink::format_entry(const Alert& alert) {
    return format_timestamp(alert.timestamp) + " - [" + to_string(alert.level) + "] " +
           alert.title + ": " + alert.message;
}

void LogSink::deliver(const Alert& alert) {
    if (!append(format_entry(alert))) {
        DebugLogger::log("log sink: could not append to ", path_);
    }
}

bool LogSink::write_line(const std::string& text) {
    return append(format_timestamp(std::chrono::system_clock::now()) + " - " + text);
}

bool LogSink::ensure_directory() {
    auto dir = std::filesystem::path(path_).parent_path();
    if (dir.empty()) {
        return true;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    if (directory_attempted_) {
        return false;
    }

    // One creation attempt per sink
    directory_attempted_ = true;
    std::filesystem::create_directories(dir, ec);
    return !ec;
}

bool LogSink::append(const std::string& line) {
    if (!ensure_directory()) {
        return false;
    }

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        return false;
    }
    file << line << "\n";
    return file.good();
}

DesktopSink::DesktopSink(std::string notifier)
    : notifier_(std::move(notifier))
{
}

bool DesktopSink::available() {
    const char* display = std::getenv("DISPLAY");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    bool session = (display && *display) || (wayland && *wayland);
    return session && command_exists("notify-send");
}

std::vector<std::string> DesktopSink::build_command(const Alert& alert) const {
    std::string urgency = "low";
    std::string timeout_ms = "2000";
    switch (alert.level) {
        case AlertLevel::Critical: urgency = "critical"; timeout_ms = "5000"; break;
        case AlertLevel::Warning:  urgency = "normal";   timeout_ms = "3000"; break;
        default: break;
    }
    return {notifier_, "-u", urgency, "-t", timeout_ms, alert.title, alert.message};
}

void DesktopSink::deliver(const Alert& alert) {
    int status = spawn_and_wait(build_command(alert));
    if (status != 0) {
        DebugLogger::log("desktop notification failed with status ", status);
    }
}

void AlertDispatcher::add_sink(std::unique_ptr<NotificationSink> sink) {
    if (!sink) {
        return;
    }
    if (auto* log = dynamic_cast<LogSink*>(sink.get())) {
        log_sink_ = log;
    }
    sinks_.push_back(std::move(sink));
}

void AlertDispatcher::dispatch(const Alert& alert) {
    for (auto& sink : sinks_) {
        try {
            sink->deliver(alert);
        } catch (const std::exception& e) {
            DebugLogger::log("sink '", sink->name(), "' failed: ", e.what());
        }
    }
}

void AlertDispatcher::log_info(const std::string& text) {
    if (log_sink_ && !log_sink_->write_line(text)) {
        DebugLogger::log("log sink: could not append to ", log_sink_->path());
    }
}

AlertDispatcher make_dispatcher(const AlertConfig& config, std::ostream& console, bool use_color) {
    AlertDispatcher dispatcher;

    if (config.log_to_file) {
        dispatcher.add_sink(std::make_unique<LogSink>(expand_home(config.log_path)));
    }
    if (config.console) {
        dispatcher.add_sink(std::make_unique<ConsoleSink>(console, use_color));
    }
    if (config.desktop && DesktopSink::available()) {
        dispatcher.add_sink(std::make_unique<DesktopSink>());
    }

    DebugLogger::log("alert sinks configured: ", dispatcher.sink_count());
    return dispatcher;
}

} // namespace hostmon
