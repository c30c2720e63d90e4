#include "app_paths.hpp"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace cml {

AppPaths AppPaths::in_directory(const std::filesystem::path& dir) {
    AppPaths paths;
    paths.pid_file = dir / ".claude-monitor-lite.pid";
    paths.config_file = dir / ".claude-monitor-lite.json";
    paths.log_file = dir / ".claude-monitor-lite.log";
    return paths;
}

std::optional<AppPaths> resolve_app_paths() {
    if (const char* dir = std::getenv("CLAUDE_MONITOR_HOME"); dir && *dir) {
        return AppPaths::in_directory(dir);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return AppPaths::in_directory(home);
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir && *pw->pw_dir) {
        return AppPaths::in_directory(pw->pw_dir);
    }
    return std::nullopt;
}

} // namespace cml
