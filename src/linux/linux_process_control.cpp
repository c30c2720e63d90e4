#include "linux_process_control.hpp"
#include <fmt/format.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace cml {

std::string LinuxProcessControl::get_signal_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. The process belongs to another user.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return fmt::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

bool LinuxProcessControl::is_alive(const int pid) {
    if (pid <= 0) return false;
    return kill(pid, 0) == 0;
}

SignalResult LinuxProcessControl::terminate(const int pid) {
    SignalResult result;

    if (pid <= 0) {
        result.success = false;
        result.error_message = "Invalid PID";
        return result;
    }

    if (kill(pid, SIGTERM) == -1) {
        const int err = errno;
        result.success = false;
        result.error_message = get_signal_error_message(err);
        return result;
    }

    result.success = true;
    return result;
}

int LinuxProcessControl::current_pid() const {
    return static_cast<int>(getpid());
}

} // namespace cml
