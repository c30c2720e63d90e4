#pragma once

#include <string>
#include <vector>

namespace cml {

// Environment flag marking the re-executed background worker
inline constexpr const char* kDaemonEnvVar = "CLAUDE_MONITOR_DAEMON";

// True when this process is the detached worker
[[nodiscard]] bool is_detached_worker();

// Copy of env (NAME=value entries) with the worker flag set exactly once
[[nodiscard]] std::vector<std::string> build_child_environment(char** env);

struct SpawnResult {
    bool success = false;
    int pid = -1;
    std::string error_message;
};

// Start our own executable again in a new session, with the worker flag set
// and the standard streams on /dev/null
SpawnResult spawn_detached_worker();

// Returns immediately in the worker. In the invoking process: spawn the
// worker, give it a moment to claim the marker, report its PID and exit(0).
// Failure to spawn exits(1) after a one-line diagnostic.
void ensure_detached();

} // namespace cml
