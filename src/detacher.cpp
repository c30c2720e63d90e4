#include "detacher.hpp"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <spawn.h>
#include <string_view>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace cml {

namespace {

// Bounds the race between the parent exiting and the worker claiming the marker
constexpr auto kDaemonStartupDelay = std::chrono::milliseconds(100);

class SpawnFileActions {
public:
    SpawnFileActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions_); }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
};

class SpawnAttributes {
public:
    SpawnAttributes() { posix_spawnattr_init(&attr_); }
    ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;

    posix_spawnattr_t* get() { return &attr_; }

private:
    posix_spawnattr_t attr_{};
};

} // namespace

bool is_detached_worker() {
    const char* value = std::getenv(kDaemonEnvVar);
    return value && std::string_view(value) == "1";
}

std::vector<std::string> build_child_environment(char** env) {
    std::vector<std::string> result;
    const std::string prefix = std::string(kDaemonEnvVar) + "=";

    for (char** entry = env; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        if (kv.substr(0, prefix.size()) == prefix) continue;
        result.emplace_back(kv);
    }
    result.push_back(prefix + "1");
    return result;
}

SpawnResult spawn_detached_worker() {
    SpawnResult result;

    std::error_code ec;
    const auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || executable.empty()) {
        result.error_message = "Failed to get executable path: " + (ec ? ec.message() : std::string("empty path"));
        return result;
    }

    SpawnFileActions actions;
    for (const int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        const int flags = (fd == STDIN_FILENO) ? O_RDONLY : O_WRONLY;
        if (const int rc = posix_spawn_file_actions_addopen(actions.get(), fd, "/dev/null", flags, 0); rc != 0) {
            result.error_message = std::string("Failed to prepare background process: ") + strerror(rc);
            return result;
        }
    }

    // The worker starts with a clean signal mask and default dispositions
    SpawnAttributes attr;
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGCHLD);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    posix_spawnattr_setsigmask(attr.get(), &empty_mask);
    posix_spawnattr_setsigdefault(attr.get(), &default_signals);
    posix_spawnattr_setflags(attr.get(), POSIX_SPAWN_SETSID | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    const std::string exe_str = executable.string();
    auto env_strings = build_child_environment(environ);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    std::vector<char*> argv = {const_cast<char*>(exe_str.c_str()), nullptr};

    pid_t pid = -1;
    if (const int rc = posix_spawn(&pid, exe_str.c_str(), actions.get(), attr.get(), argv.data(), envp.data()); rc != 0) {
        result.error_message = std::string("Failed to start background process: ") + strerror(rc);
        return result;
    }

    result.success = true;
    result.pid = static_cast<int>(pid);
    return result;
}

void ensure_detached() {
    if (is_detached_worker()) {
        return;
    }

    const auto spawned = spawn_detached_worker();
    if (!spawned.success) {
        std::cerr << spawned.error_message << std::endl;
        std::exit(1);
    }

    spdlog::debug("[detach] worker started with PID {}", spawned.pid);
    std::cout << "Claude Monitor Lite started in background (PID: " << spawned.pid << ")\n";
    std::cout << "Open the indicator window to view usage.\n";
    std::cout << "Quit from the indicator or run 'claude-monitor-lite stop' to stop.\n";
    std::cout.flush();

    std::this_thread::sleep_for(kDaemonStartupDelay);
    std::exit(0);
}

} // namespace cml
