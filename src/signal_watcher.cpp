#include "signal_watcher.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace cml {

namespace {

constexpr int kPollTimeoutMs = 200;

sigset_t termination_mask() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    return mask;
}

} // namespace

bool block_termination_signals() {
    const sigset_t mask = termination_mask();
    if (const int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0) {
        spdlog::error("[signals] pthread_sigmask failed: {}", strerror(rc));
        return false;
    }
    return true;
}

SignalWatcher::~SignalWatcher() {
    stop();
}

bool SignalWatcher::start(std::function<void(int signo)> on_signal) {
    if (running_) return true;

    const sigset_t mask = termination_mask();
    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        spdlog::error("[signals] signalfd failed: {}", strerror(errno));
        return false;
    }

    on_signal_ = std::move(on_signal);
    running_ = true;
    thread_ = std::thread(&SignalWatcher::watch_loop, this);
    return true;
}

void SignalWatcher::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (signal_fd_ >= 0) {
        close(signal_fd_);
        signal_fd_ = -1;
    }
}

void SignalWatcher::watch_loop() {
    pollfd pfd{signal_fd_, POLLIN, 0};

    while (running_) {
        const int ready = poll(&pfd, 1, kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[signals] poll failed: {}", strerror(errno));
            return;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) continue;

        signalfd_siginfo info{};
        if (read(signal_fd_, &info, sizeof(info)) != static_cast<ssize_t>(sizeof(info))) {
            continue;
        }

        const int signo = static_cast<int>(info.ssi_signo);
        spdlog::info("[signals] received {}, shutting down", strsignal(signo));
        if (on_signal_) {
            on_signal_(signo);
        }
        return;
    }
}

} // namespace cml
