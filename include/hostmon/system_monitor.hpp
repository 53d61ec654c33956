#pragma once

#include "hostmon/config_manager.hpp"
#include "hostmon/metrics_collector.hpp"
#include "hostmon/alert_engine.hpp"
#include "hostmon/notification_sink.hpp"
#include "hostmon/process_ranker.hpp"
#include "hostmon/display.hpp"
#include "hostmon/cancellation.hpp"
#include "hostmon/sampler.hpp"
#include <chrono>
#include <cstddef>
#include <iostream>

namespace hostmon {

enum class RunMode {
    Snapshot,
    LogOnly,
    Continuous
};

enum class LoopState {
    Idle,
    Sampling,
    Evaluating,
    Rendering,
    Sleeping,
    Stopped
};

const char* to_string(LoopState state);

class SystemMonitor {
public:
    SystemMonitor(const MonitorConfig& config,
                  MetricsCollector& collector,
                  AlertDispatcher& dispatcher,
                  Display& display,
                  std::ostream& out = std::cout);

    // Returns the process exit code. Continuous mode runs until the token is cancelled.
    int run(RunMode mode, std::chrono::seconds interval, CancellationToken& token);

    LoopState state() const { return state_; }
    std::size_t cycles() const { return cycles_; }

private:
    void run_cycle(bool render);
    void continuous_loop(std::chrono::seconds interval, CancellationToken& token);

    const MonitorConfig& config_;
    MetricsCollector& collector_;
    AlertDispatcher& dispatcher_;
    Display& display_;
    std::ostream& out_;
    Sampler sampler_;
    AlertEngine alert_engine_;
    ProcessRanker ranker_;

    LoopState state_ = LoopState::Idle;
    std::size_t cycles_ = 0;
};

} // namespace hostmon
