#pragma once

#include "presentation.hpp"
#include <ncurses.h>

namespace gpudash::tui::colors {

// Color pair IDs for ncurses
enum ColorPair {
    DEFAULT = 0,

    // Text colors
    TEXT_PRIMARY = 1,
    TEXT_DIM = 2,

    // Severity colors
    STATUS_OK = 3,
    STATUS_WARN = 4,
    STATUS_CRITICAL = 5,
    STATUS_UNKNOWN = 6,

    // UI elements
    BORDER = 7,
    HEADER = 8,
    FOOTER = 9
};

// Initialize all color pairs
inline void init_color_pairs() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Dim gray needs a 256-color terminal
    short gray = COLORS >= 256 ? 244 : COLOR_WHITE;

    init_pair(TEXT_PRIMARY, COLOR_WHITE, -1);
    init_pair(TEXT_DIM, gray, -1);

    init_pair(STATUS_OK, COLOR_GREEN, -1);
    init_pair(STATUS_WARN, COLOR_YELLOW, -1);
    init_pair(STATUS_CRITICAL, COLOR_RED, -1);
    init_pair(STATUS_UNKNOWN, gray, -1);

    init_pair(BORDER, COLOR_CYAN, -1);
    init_pair(HEADER, COLOR_BLACK, COLOR_CYAN);
    init_pair(FOOTER, COLOR_CYAN, -1);
}

// Severity color to the pair that draws it
inline int pair_for(Color color) {
    switch (color) {
        case Color::Green:  return STATUS_OK;
        case Color::Yellow: return STATUS_WARN;
        case Color::Red:    return STATUS_CRITICAL;
        case Color::Gray:   return STATUS_UNKNOWN;
    }
    return STATUS_UNKNOWN;
}

} // namespace gpudash::tui::colors
