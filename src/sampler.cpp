#include "hostmon/sampler.hpp"
#include <thread>

namespace hostmon {

Snapshot::Snapshot(int cpu_pct, int ram_pct, int swap_pct, int disk_pct,
                   std::optional<int> temperature,
                   std::chrono::system_clock::time_point timestamp,
                   std::vector<std::string> unreadable)
    : cpu_pct_(clamp_percent(cpu_pct))
    , ram_pct_(clamp_percent(ram_pct))
    , swap_pct_(clamp_percent(swap_pct))
    , disk_pct_(clamp_percent(disk_pct))
    , temperature_(temperature)
    , timestamp_(timestamp)
    , unreadable_(std::move(unreadable))
{
}

Sampler::Sampler(MetricsCollector& collector, const MonitorConfig& config)
    : collector_(collector)
    , root_mount_(config.sources.root_mount)
    , cpu_window_(config.cpu_sample_ms)
{
}

int Sampler::sample_cpu(std::vector<std::string>& unreadable) {
    auto before = collector_.read_cpu_counters();
    if (cpu_window_.count() > 0) {
        std::this_thread::sleep_for(cpu_window_);
    }
    auto after = collector_.read_cpu_counters();

    if (!before || !after || after->total() <= before->total()) {
        unreadable.push_back("cpu");
        return 0;
    }
    return compute_cpu_usage(*before, *after);
}

Snapshot Sampler::sample() {
    std::vector<std::string> unreadable;

    int cpu = sample_cpu(unreadable);

    int ram = 0;
    int swap = 0;
    if (auto memory = collector_.read_memory()) {
        ram = percent_of(memory->ram.used_kb, memory->ram.total_kb);
        swap = percent_of(memory->swap.used_kb, memory->swap.total_kb);
    } else {
        unreadable.push_back("memory");
    }

    int disk = 0;
    if (auto usage = collector_.read_disk_usage(root_mount_)) {
        disk = *usage;
    } else {
        unreadable.push_back("disk");
    }

    auto temperature = collector_.read_temperature();
    if (!temperature) {
        unreadable.push_back("temperature");
    }

    for (const auto& source : unreadable) {
        DebugLogger::log("source unreadable this cycle: ", source);
    }

    return Snapshot(cpu, ram, swap, disk, temperature,
                    std::chrono::system_clock::now(), std::move(unreadable));
}

} // namespace hostmon
