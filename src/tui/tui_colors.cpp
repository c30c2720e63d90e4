#include "tui_colors.hpp"

namespace cml {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_BORDER, COLOR_BLUE, -1);

    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);

    init_pair(COLOR_PAIR_TIER_NEUTRAL, COLOR_WHITE, -1);
    init_pair(COLOR_PAIR_TIER_LOW, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_TIER_MID, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_TIER_HIGH, COLOR_RED, -1);
}

int get_tier_color(const UsageTier tier) {
    switch (tier) {
        case UsageTier::Low:
            return COLOR_PAIR_TIER_LOW;
        case UsageTier::Mid:
            return COLOR_PAIR_TIER_MID;
        case UsageTier::High:
            return COLOR_PAIR_TIER_HIGH;
        case UsageTier::Neutral:
            break;
    }
    return COLOR_PAIR_TIER_NEUTRAL;
}

} // namespace cml
