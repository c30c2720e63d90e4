#include "usage_format.hpp"
#include <fmt/format.h>
#include <cmath>
#include <ctime>

namespace cml {

int round_utilization(const double utilization) {
    return static_cast<int>(std::floor(utilization + 0.5));
}

UsageTier usage_tier(const double utilization) {
    if (utilization < 50.0) return UsageTier::Low;
    if (utilization < 80.0) return UsageTier::Mid;
    return UsageTier::High;
}

std::string_view tier_glyph(const UsageTier tier) {
    switch (tier) {
        case UsageTier::Low: return "🟢";
        case UsageTier::Mid: return "🟡";
        case UsageTier::High: return "🔴";
        case UsageTier::Neutral: break;
    }
    return "⚪";
}

int round_to_ten_minutes(const int minutes) {
    return ((minutes + 5) / 10) * 10;
}

std::optional<ResetCountdown> time_until_reset(const std::optional<Clock::time_point>& resets_at,
                                               const Clock::time_point now) {
    if (!resets_at || *resets_at <= now) {
        return std::nullopt;
    }

    const auto total = std::chrono::duration_cast<std::chrono::minutes>(*resets_at - now).count();
    const int rounded = round_to_ten_minutes(static_cast<int>(total));
    return ResetCountdown{rounded / 60, rounded % 60};
}

std::string format_reset_time(const Clock::time_point resets_at) {
    const auto time_t_val = Clock::to_time_t(resets_at);
    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);

    int hour = tm_val.tm_hour;
    int minute = round_to_ten_minutes(tm_val.tm_min);
    if (minute >= 60) {
        hour = (hour + 1) % 24;
        minute = 0;
    }

    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}",
                       tm_val.tm_year + 1900, tm_val.tm_mon + 1, tm_val.tm_mday, hour, minute);
}

std::string format_window_line(const std::optional<UsageLimit>& limit, std::string_view label,
                               const Clock::time_point now) {
    if (!limit) {
        return fmt::format("{} --", label);
    }

    const int utilization = round_utilization(limit->utilization);
    const auto countdown = time_until_reset(limit->resets_at, now);

    if (!countdown && utilization == 0) {
        return fmt::format("{} {}% (no active session)", label, utilization);
    }
    if (countdown) {
        return fmt::format("{} {}% (resets {}, in {}h {}m)", label, utilization,
                           format_reset_time(*limit->resets_at), countdown->hours, countdown->minutes);
    }
    return fmt::format("{} {}%", label, utilization);
}

std::string format_indicator(const std::optional<UsageLimit>& limit, const Clock::time_point now) {
    if (!limit) {
        return fmt::format("{} --", tier_glyph(UsageTier::Neutral));
    }

    const int utilization = round_utilization(limit->utilization);
    const auto glyph = tier_glyph(usage_tier(limit->utilization));

    if (const auto countdown = time_until_reset(limit->resets_at, now)) {
        return fmt::format("{} {}% ({}h{}m)", glyph, utilization, countdown->hours, countdown->minutes);
    }
    return fmt::format("{} {}%", glyph, utilization);
}

std::string format_console_line(const std::optional<UsageLimit>& limit, std::string_view label,
                                std::string_view no_session_message, const Clock::time_point now) {
    if (!limit) {
        return fmt::format("{}  --", label);
    }

    const int utilization = round_utilization(limit->utilization);
    if (const auto countdown = time_until_reset(limit->resets_at, now)) {
        return fmt::format("{}  {:3d}%  (resets {}, in {}h {}m)", label, utilization,
                           format_reset_time(*limit->resets_at), countdown->hours, countdown->minutes);
    }
    if (!no_session_message.empty()) {
        return fmt::format("{}  {:3d}%  ({})", label, utilization, no_session_message);
    }
    return fmt::format("{}  {:3d}%", label, utilization);
}

std::string format_console_report(const UsageSnapshot& snapshot, const Clock::time_point now) {
    std::string out = "=== Current Usage ===\n";
    for (const auto w : kAllWindows) {
        const std::string_view no_session = (w == UsageWindow::CurrentSession) ? "no active session" : "";
        out += format_console_line(snapshot.limit(w), window_label(w), no_session, now);
        out += '\n';
    }
    out += '\n';
    return out;
}

std::string format_selected_summary(const UsageSnapshot& snapshot, const DisplayMode mode) {
    const auto& limit = snapshot.limit(mode);
    const double utilization = limit ? limit->utilization : 0.0;
    return fmt::format("Menu Bar Shows:  {} ({} {}%)", window_name(mode),
                       tier_glyph(usage_tier(utilization)), round_utilization(utilization));
}

IndicatorViewModel render_indicator(const UsageSnapshot* snapshot, const DisplayMode mode,
                                    const Clock::time_point now) {
    IndicatorViewModel vm;
    vm.selected = mode;

    for (const auto w : kAllWindows) {
        vm.lines[window_index(w)] = snapshot
            ? format_window_line(snapshot->limit(w), window_label(w), now)
            : fmt::format("{} --", window_label(w));
    }

    if (!snapshot) {
        vm.title = fmt::format("{} Loading...", tier_glyph(UsageTier::Neutral));
        vm.tier = UsageTier::Neutral;
        return vm;
    }

    const auto& limit = snapshot->limit(mode);
    vm.title = format_indicator(limit, now);
    vm.tier = limit ? usage_tier(limit->utilization) : UsageTier::Neutral;
    return vm;
}

} // namespace cml
