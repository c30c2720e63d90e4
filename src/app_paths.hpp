#pragma once

#include <filesystem>
#include <optional>

namespace cml {

// Per-user files. The directory is $CLAUDE_MONITOR_HOME, else $HOME, else
// the passwd entry of the current user.
struct AppPaths {
    std::filesystem::path pid_file;     // .claude-monitor-lite.pid
    std::filesystem::path config_file;  // .claude-monitor-lite.json
    std::filesystem::path log_file;     // .claude-monitor-lite.log

    static AppPaths in_directory(const std::filesystem::path& dir);
};

// Empty when no home directory can be determined
std::optional<AppPaths> resolve_app_paths();

} // namespace cml
