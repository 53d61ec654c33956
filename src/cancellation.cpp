#include "hostmon/cancellation.hpp"
#include "hostmon/metrics_collector.hpp"
#include <cstring>
#include <ctime>
#include <pthread.h>

namespace hostmon {

static sigset_t termination_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

// Consumes termination signals still pending so that unblocking cannot kill the process
static void drain_pending(const sigset_t& set) {
    const timespec no_wait{0, 0};
    while (sigtimedwait(&set, nullptr, &no_wait) > 0) {
        DebugLogger::log("discarded pending termination signal");
    }
}

SignalWatcher::SignalWatcher(CancellationToken& token)
    : token_(token)
{
    sigset_t set = termination_signals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, &previous_mask_);
    if (rc != 0) {
        DebugLogger::log("pthread_sigmask failed: ", std::strerror(rc));
        return;
    }
    thread_ = std::thread(&SignalWatcher::watch, this);
    active_ = true;
}

SignalWatcher::~SignalWatcher() {
    if (!active_) {
        return;
    }
    stopping_ = true;
    if (received_ == 0) {
        // Wake the watcher so it can exit
        pthread_kill(thread_.native_handle(), SIGTERM);
    }
    thread_.join();

    sigset_t set = termination_signals();
    drain_pending(set);
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::watch() {
    sigset_t set = termination_signals();
    int sig = 0;
    if (sigwait(&set, &sig) != 0 || stopping_) {
        return;
    }
    received_ = sig;
    DebugLogger::log("received signal ", sig);
    token_.cancel();
}

} // namespace hostmon
