#pragma once

#include "usage_snapshot.hpp"
#include "viewmodels/indicator_view_model.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cml {

using Clock = std::chrono::system_clock;

// Round-half-up to a whole percent: 49.5 -> 50, 79.4 -> 79
[[nodiscard]] int round_utilization(double utilization);

// Tier from the raw (unrounded) utilization
[[nodiscard]] UsageTier usage_tier(double utilization);
[[nodiscard]] std::string_view tier_glyph(UsageTier tier);

// Nearest multiple of ten, halves rounding up: 83 -> 80, 85 -> 90
[[nodiscard]] int round_to_ten_minutes(int minutes);

struct ResetCountdown {
    int hours = 0;
    int minutes = 0;  // 0, 10, ..., 50
};

// Empty unless the reset lies in the future
[[nodiscard]] std::optional<ResetCountdown> time_until_reset(
    const std::optional<Clock::time_point>& resets_at, Clock::time_point now);

// Local "YYYY-MM-DD HH:MM", minutes rounded to ten
[[nodiscard]] std::string format_reset_time(Clock::time_point resets_at);

// Menu line: "5-Hour Session: 42% (resets 2025-01-01 18:00, in 1h 20m)"
[[nodiscard]] std::string format_window_line(const std::optional<UsageLimit>& limit,
                                             std::string_view label, Clock::time_point now);

// Compact indicator: "🟢 42% (1h20m)"
[[nodiscard]] std::string format_indicator(const std::optional<UsageLimit>& limit, Clock::time_point now);

// Console line: "5-Hour Session:   42%  (resets ..., in 1h 20m)"
[[nodiscard]] std::string format_console_line(const std::optional<UsageLimit>& limit,
                                              std::string_view label,
                                              std::string_view no_session_message,
                                              Clock::time_point now);

// Multi-line report printed by the CLI
[[nodiscard]] std::string format_console_report(const UsageSnapshot& snapshot, Clock::time_point now);

// "Menu Bar Shows:  5-Hour Session (🟢 42%)"
[[nodiscard]] std::string format_selected_summary(const UsageSnapshot& snapshot, DisplayMode mode);

// Whole indicator/menu state. A null snapshot renders the loading placeholder.
[[nodiscard]] IndicatorViewModel render_indicator(const UsageSnapshot* snapshot, DisplayMode mode,
                                                  Clock::time_point now);

} // namespace cml
