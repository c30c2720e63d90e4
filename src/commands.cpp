#include "commands.hpp"
#include "usage_format.hpp"
#include <spdlog/spdlog.h>
#include <ostream>
#include <thread>

namespace cml {

void print_usage(std::ostream& out) {
    out << "Claude Monitor Lite - desktop monitor for Claude usage\n\n";
    out << "Usage:\n";
    out << "  claude-monitor-lite           Auto-start (login if needed, show status if running)\n";
    out << "  claude-monitor-lite stop      Stop the monitor\n";
    out << "  claude-monitor-lite logout    Clear session and stop monitor\n";
    out << "  claude-monitor-lite watch     Show live usage in the terminal\n";
    out << "  claude-monitor-lite help      Show this help\n\n";
    out << "First time? Just run: claude-monitor-lite\n";
}

bool print_usage_report(IUsageClient& client, std::ostream& out) {
    const auto result = client.fetch_usage();
    if (!result.ok()) {
        if (result.error) {
            spdlog::warn("[cli] could not fetch usage: {}", result.error->message);
        }
        return false;
    }
    out << format_console_report(*result.snapshot, std::chrono::system_clock::now());
    return true;
}

int run_stop(SingleInstance& instance, IProcessControl& process_control, std::ostream& out, std::ostream& err,
             const std::chrono::milliseconds wait) {
    if (!instance.is_active()) {
        out << "Claude Monitor Lite is not running.\n";
        return 0;
    }

    const auto pid = instance.active_pid();
    if (!pid) {
        err << "Failed to read PID file: " << instance.marker_path().string() << std::endl;
        return 1;
    }

    const auto result = process_control.terminate(*pid);
    if (!result.success) {
        err << "Failed to stop process: " << result.error_message << std::endl;
        return 1;
    }

    out << "Claude Monitor Lite (PID: " << *pid << ") stopped.\n";
    spdlog::info("[cli] sent SIGTERM to {}", *pid);

    std::this_thread::sleep_for(wait);
    if (const auto released = instance.release(); !released.success) {
        err << "Warning: Failed to remove PID file: " << released.error_message << std::endl;
    }
    return 0;
}

int run_logout(SingleInstance& instance, IProcessControl& process_control, IConfigStore& store,
               std::ostream& out, std::ostream& err, const std::chrono::milliseconds wait) {
    if (instance.is_active()) {
        out << "Stopping monitor...\n";
        if (const auto pid = instance.active_pid()) {
            if (const auto result = process_control.terminate(*pid); result.success) {
                std::this_thread::sleep_for(wait);
            } else {
                spdlog::warn("[cli] could not stop PID {}: {}", *pid, result.error_message);
            }
        }
        if (const auto released = instance.release(); !released.success) {
            err << "Warning: Failed to remove PID file: " << released.error_message << std::endl;
        }
    }

    if (const auto cleared = store.clear(); !cleared.success) {
        err << "Failed to clear session: " << cleared.error_message << std::endl;
        return 1;
    }

    out << "✓ Logged out! All config and session data removed.\n";
    return 0;
}

int run_status(SingleInstance& instance, IConfigStore& store, IUsageClient& client, std::ostream& out,
               std::ostream& err) {
    out << "✓ Already running (PID: " << instance.active_pid().value_or(0) << ")\n\n";

    const auto result = client.fetch_usage();
    if (!result.ok()) {
        err << "Error loading usage data: " << (result.error ? result.error->message : "empty response") << std::endl;
        out << "Try running 'claude-monitor-lite logout' then restart.\n";
        return 1;
    }

    out << format_console_report(*result.snapshot, std::chrono::system_clock::now());
    out << format_selected_summary(*result.snapshot, store.load_display_mode()) << "\n";
    return 0;
}

} // namespace cml
