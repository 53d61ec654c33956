#include "hostmon/system_monitor.hpp"

namespace hostmon {

const char* to_string(LoopState state) {
    switch (state) {
        case LoopState::Idle:       return "idle";
        case LoopState::Sampling:   return "sampling";
        case LoopState::Evaluating: return "evaluating";
        case LoopState::Rendering:  return "rendering";
        case LoopState::Sleeping:   return "sleeping";
        case LoopState::Stopped:    return "stopped";
    }
    return "";
}

SystemMonitor::SystemMonitor(const MonitorConfig& config,
                             MetricsCollector& collector,
                             AlertDispatcher& dispatcher,
                             Display& display,
                             std::ostream& out)
    : config_(config)
    , collector_(collector)
    , dispatcher_(dispatcher)
    , display_(display)
    , out_(out)
    , sampler_(collector, config)
    , alert_engine_(config.thresholds)
    , ranker_(collector)
{
}

int SystemMonitor::run(RunMode mode, std::chrono::seconds interval, CancellationToken& token) {
    switch (mode) {
        case RunMode::Snapshot:
            run_cycle(true);
            break;
        case RunMode::LogOnly:
            run_cycle(false);
            break;
        case RunMode::Continuous:
            continuous_loop(interval, token);
            break;
    }
    state_ = LoopState::Stopped;
    return 0;
}

void SystemMonitor::run_cycle(bool render) {
    state_ = LoopState::Sampling;
    const Snapshot snapshot = sampler_.sample();

    state_ = LoopState::Evaluating;
    auto alerts = alert_engine_.evaluate(snapshot);
    if (config_.alerts.dispatch_swap) {
        if (auto swap = alert_engine_.check_swap(snapshot)) {
            alerts.push_back(*swap);
        }
    }
    for (const auto& alert : alerts) {
        dispatcher_.dispatch(alert);
    }

    if (render) {
        state_ = LoopState::Rendering;
        auto top_cpu = ranker_.top(SortKey::Cpu);
        auto top_mem = ranker_.top(SortKey::Mem);
        display_.render(snapshot, top_cpu, top_mem, collector_.collect_system_info());
    }

    ++cycles_;
    state_ = LoopState::Idle;
    DebugLogger::log("cycle ", cycles_, " done: cpu=", snapshot.cpu_pct(), "% ram=", snapshot.ram_pct(),
                     "% disk=", snapshot.disk_pct(), "% alerts=", alerts.size());
}

void SystemMonitor::continuous_loop(std::chrono::seconds interval, CancellationToken& token) {
    out_ << "Continuous monitoring every " << interval.count()
        << " seconds. Press Ctrl+C to stop.\n";
    dispatcher_.log_info("Continuous monitoring started, interval " + std::to_string(interval.count()) + "s");

    while (!token.cancelled()) {
        display_.clear_screen();
        run_cycle(true);

        // Only suspension point; cancellation is observed here
        state_ = LoopState::Sleeping;
        if (token.wait_for(interval)) {
            break;
        }
    }

    out_ << "\nStopping monitoring...\n";
    dispatcher_.log_info("Continuous monitoring stopped after " + std::to_string(cycles_) + " cycles");
}

} // namespace hostmon
