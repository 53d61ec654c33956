#pragma once

#include "hostmon/alert_engine.hpp"
#include "hostmon/config_manager.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace hostmon {

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual const char* name() const = 0;
    virtual void deliver(const Alert& alert) = 0;
};

// Severity-colored line on a terminal stream
class ConsoleSink : public NotificationSink {
public:
    explicit ConsoleSink(std::ostream& out, bool use_color = true);

    const char* name() const override { return "console"; }
    void deliver(const Alert& alert) override;

private:
    std::ostream& out_;
    bool use_color_;
};

// Append-only log file, opened and closed on every write. Failures are swallowed.
class LogSink : public NotificationSink {
public:
    explicit LogSink(std::string path);

    const char* name() const override { return "log"; }
    void deliver(const Alert& alert) override;

    // Unstructured informational line, timestamp-prefixed
    bool write_line(const std::string& text);

    const std::string& path() const { return path_; }

    static std::string format_entry(const Alert& alert);

private:
    bool append(const std::string& line);
    bool ensure_directory();

    std::string path_;
    bool directory_attempted_ = false;
};

// notify-send; only constructed when a desktop session is present
class DesktopSink : public NotificationSink {
public:
    explicit DesktopSink(std::string notifier = "notify-send");

    // DISPLAY or WAYLAND_DISPLAY set and notify-send on $PATH
    static bool available();

    const char* name() const override { return "desktop"; }
    void deliver(const Alert& alert) override;

    std::vector<std::string> build_command(const Alert& alert) const;

private:
    std::string notifier_;
};

class AlertDispatcher {
public:
    void add_sink(std::unique_ptr<NotificationSink> sink);

    // Every sink sees every alert; a throwing sink does not stop the rest
    void dispatch(const Alert& alert);

    // Informational line for the log sink, when one is configured
    void log_info(const std::string& text);

    std::size_t sink_count() const { return sinks_.size(); }

private:
    std::vector<std::unique_ptr<NotificationSink>> sinks_;
    LogSink* log_sink_ = nullptr;
};

AlertDispatcher make_dispatcher(const AlertConfig& config, std::ostream& console, bool use_color);

} // namespace hostmon
