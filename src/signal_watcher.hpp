#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace cml {

// Block SIGINT and SIGTERM for the calling thread. Call from main before any
// other thread starts so every thread inherits the mask and the signals are
// only seen by SignalWatcher.
bool block_termination_signals();

// Waits on a signalfd for SIGINT/SIGTERM and invokes the callback once on
// its own thread.
class SignalWatcher {
public:
    SignalWatcher() = default;
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    bool start(std::function<void(int signo)> on_signal);
    void stop();

private:
    void watch_loop();

    int signal_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::function<void(int)> on_signal_;
};

} // namespace cml
