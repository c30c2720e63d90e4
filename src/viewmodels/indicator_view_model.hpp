#pragma once

#include "../usage_snapshot.hpp"
#include <array>
#include <string>

namespace cml {

// Colour tier of the compact indicator
enum class UsageTier {
    Neutral,  // loading, error, no data
    Low,      // below 50%
    Mid,      // 50% up to 80%
    High      // 80% and above
};

// Everything a frontend needs to draw the indicator and its menu
struct IndicatorViewModel {
    std::string title = "⚪ Loading...";
    UsageTier tier = UsageTier::Neutral;

    // One menu line per window, indexed by window_index()
    std::array<std::string, 3> lines = {"5-Hour Session: --", "Weekly (All): --", "Weekly (Opus): --"};

    DisplayMode selected = DisplayMode::CurrentSession;
    bool session_expired = false;

    [[nodiscard]] const std::string& line(UsageWindow w) const { return lines[window_index(w)]; }
    [[nodiscard]] bool is_selected(UsageWindow w) const { return selected == w; }
};

} // namespace cml
