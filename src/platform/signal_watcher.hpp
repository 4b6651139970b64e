#pragma once

#include <atomic>
#include <stop_token>
#include <thread>

// Turns SIGINT/SIGTERM into a stop request on a shared stop_source.
// Construct before any other thread is started so the blocked signal mask
// is inherited by every thread.
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source source);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start();
    bool signalled() const { return signalled_.load(std::memory_order_acquire); }

private:
    void watch(std::stop_token stop);

    std::stop_source source_;
    int signal_fd_ = -1;
    std::atomic<bool> signalled_{false};
    std::jthread thread_;
};
