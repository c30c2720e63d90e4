#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cml {

// The three tracked usage-accounting periods
enum class UsageWindow {
    CurrentSession,  // rolling 5-hour session
    WeeklyAll,       // 7 days, all models
    WeeklyOpus       // 7 days, Opus only
};

inline constexpr std::array<UsageWindow, 3> kAllWindows = {
    UsageWindow::CurrentSession, UsageWindow::WeeklyAll, UsageWindow::WeeklyOpus};

inline constexpr std::size_t window_index(UsageWindow w) { return static_cast<std::size_t>(w); }

// Which window the compact indicator shows. Exactly one is active at a time.
using DisplayMode = UsageWindow;

// Config values ("currentSession", "weeklyAll", "weeklyOpus")
std::string_view display_mode_key(DisplayMode mode);
std::optional<DisplayMode> parse_display_mode(std::string_view key);

// Menu labels ("5-Hour Session:") and names ("5-Hour Session")
std::string_view window_label(UsageWindow w);
std::string_view window_name(UsageWindow w);

struct UsageLimit {
    double utilization = 0.0;  // percent
    std::optional<std::chrono::system_clock::time_point> resets_at;
};

// One complete reading of all windows. Immutable once published.
struct UsageSnapshot {
    std::array<std::optional<UsageLimit>, 3> windows;
    std::chrono::system_clock::time_point fetched_at;

    [[nodiscard]] const std::optional<UsageLimit>& limit(UsageWindow w) const {
        return windows[window_index(w)];
    }
    std::optional<UsageLimit>& limit(UsageWindow w) {
        return windows[window_index(w)];
    }
};

} // namespace cml
