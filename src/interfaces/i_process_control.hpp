#pragma once

#include <string>

namespace cml {

struct SignalResult {
    bool success = false;
    std::string error_message;
};

// Liveness probe and graceful termination for a process identifier
class IProcessControl {
public:
    virtual ~IProcessControl() = default;

    // Zero-effect probe (signal 0)
    [[nodiscard]] virtual bool is_alive(int pid) = 0;

    // Ask the process to shut down (SIGTERM)
    virtual SignalResult terminate(int pid) = 0;

    [[nodiscard]] virtual int current_pid() const = 0;
};

} // namespace cml
