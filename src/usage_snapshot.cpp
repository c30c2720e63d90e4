#include "usage_snapshot.hpp"

namespace cml {

std::string_view display_mode_key(DisplayMode mode) {
    switch (mode) {
        case UsageWindow::CurrentSession: return "currentSession";
        case UsageWindow::WeeklyAll: return "weeklyAll";
        case UsageWindow::WeeklyOpus: return "weeklyOpus";
    }
    return "currentSession";
}

std::optional<DisplayMode> parse_display_mode(std::string_view key) {
    for (const auto w : kAllWindows) {
        if (display_mode_key(w) == key) return w;
    }
    return std::nullopt;
}

std::string_view window_label(UsageWindow w) {
    switch (w) {
        case UsageWindow::CurrentSession: return "5-Hour Session:";
        case UsageWindow::WeeklyAll: return "Weekly (All):";
        case UsageWindow::WeeklyOpus: return "Weekly (Opus):";
    }
    return "";
}

std::string_view window_name(UsageWindow w) {
    switch (w) {
        case UsageWindow::CurrentSession: return "5-Hour Session";
        case UsageWindow::WeeklyAll: return "Weekly (All)";
        case UsageWindow::WeeklyOpus: return "Weekly (Opus)";
    }
    return "";
}

} // namespace cml
