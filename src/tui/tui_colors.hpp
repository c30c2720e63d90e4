#pragma once

#include "../viewmodels/indicator_view_model.hpp"
#include <ncurses.h>

namespace cml {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_TITLE = 1,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_TIER_NEUTRAL,
    COLOR_PAIR_TIER_LOW,
    COLOR_PAIR_TIER_MID,
    COLOR_PAIR_TIER_HIGH,
};

// Initialize ncurses color pairs
void init_colors();

// Color pair for a usage tier
int get_tier_color(UsageTier tier);

} // namespace cml
