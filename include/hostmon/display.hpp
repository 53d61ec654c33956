#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/alert_engine.hpp"
#include "hostmon/process_ranker.hpp"
#include "hostmon/sampler.hpp"
#include "hostmon/system_info.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace hostmon {

class Display {
public:
    // interactive: out is a terminal, so colors and screen clearing apply
    Display(const MonitorConfig& config, std::ostream& out = std::cout, bool interactive = true);

    // Full report: resources, both process rankings, auxiliary counts
    void render(const Snapshot& snapshot,
                const std::vector<ProcessEntry>& top_cpu,
                const std::vector<ProcessEntry>& top_mem,
                const SystemInfo& info);

    void clear_screen();

private:
    void render_header(const Snapshot& snapshot, const SystemInfo& info);
    void render_resources(const Snapshot& snapshot);
    void render_metric(const std::string& label, int value, AlertLevel level, const std::string& tag);
    void render_processes(const std::vector<ProcessEntry>& rows, SortKey key, const std::string& title);
    void render_additional(const SystemInfo& info);
    void render_banner(const std::string& title);

    // Helper rendering functions
    std::string create_progress_bar(int percentage, int width, AlertLevel level);

    // Color helpers (ANSI escape codes)
    std::string colorize(const std::string& text, AlertLevel level);
    std::string color_code(AlertLevel level);
    std::string highlight_code(RowHighlight highlight);
    std::string reset_color();

    std::ostream& out_;
    ThresholdConfig thresholds_;
    DisplayConfig config_;
    bool interactive_;
    bool use_color_;
    std::string syslog_path_;
};

// Helper functions for formatting
std::string format_bytes(uint64_t bytes);

} // namespace hostmon
