#include "logging.hpp"
#include "signal_watcher.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string_view>

namespace cml {

namespace {

constexpr std::size_t kMaxLogFileSize = 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum level_from_env(spdlog::level::level_enum fallback) {
    const char* value = std::getenv("CLAUDE_MONITOR_LOG_LEVEL");
    if (!value || !*value) return fallback;
    // from_str maps unknown names to "off"; only accept the ones it knows
    const auto level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && std::string_view(value) != "off") return fallback;
    return level;
}

} // namespace

void init_file_logging(const std::filesystem::path& log_file) {
    try {
        auto logger = spdlog::rotating_logger_mt("claude-monitor-lite", log_file.string(),
                                                 kMaxLogFileSize, kMaxLogFiles);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [pid %P] %v");
        logger->set_level(level_from_env(spdlog::level::info));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(5));
    } catch (const spdlog::spdlog_ex&) {
        // No usable log file: keep running silently rather than writing to
        // a terminal we no longer own
        spdlog::set_level(spdlog::level::off);
    }
}

bool init_worker_logging(const std::filesystem::path& log_file) {
    if (!block_termination_signals()) {
        return false;
    }
    init_file_logging(log_file);
    return true;
}

void init_console_logging() {
    auto logger = spdlog::stderr_color_mt("claude-monitor-lite");
    logger->set_pattern("%^[%l]%$ %v");
    logger->set_level(level_from_env(spdlog::level::warn));
    spdlog::set_default_logger(logger);
}

} // namespace cml
