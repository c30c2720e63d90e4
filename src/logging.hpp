#pragma once

#include <filesystem>

namespace cml {

// Background and watch modes: rotating file, nothing on the terminal
void init_file_logging(const std::filesystem::path& log_file);

// Daemon and watch entry: block SIGINT/SIGTERM, then start file logging.
// The order matters: spdlog's periodic flusher is a thread and must inherit
// the blocked mask, or a termination signal kills the process instead of
// reaching SignalWatcher. False if the signals could not be blocked.
[[nodiscard]] bool init_worker_logging(const std::filesystem::path& log_file);

// Foreground commands: warnings and errors on stderr
void init_console_logging();

} // namespace cml
