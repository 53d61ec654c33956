#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <signal.h>

namespace hostmon {

class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Sleeps for up to timeout; true if cancelled before or during the wait
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

// Blocks SIGINT and SIGTERM for the process and cancels the token from a
// dedicated sigwait() thread. Restores the previous mask on destruction.
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationToken& token);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Signal number that cancelled the token, 0 if none
    int received() const { return received_; }

private:
    void watch();

    CancellationToken& token_;
    sigset_t previous_mask_;
    std::thread thread_;
    bool active_ = false;
    std::atomic<int> received_{0};
    std::atomic<bool> stopping_{false};
};

} // namespace hostmon
