#pragma once

namespace gpudash::tui {

struct Region {
    int y = 0;
    int x = 0;
    int height = 0;
    int width = 0;
};

struct LayoutDimensions {
    // Terminal size
    int term_width = 0;
    int term_height = 0;

    // Fixed rows
    int header_height = 3;
    int footer_height = 3;
    int gauge_height = 3;

    // Calculated regions
    Region header;
    Region body;
    Region footer;

    // Inside the body border
    Region text;
    Region utilization_gauge;
    Region vram_gauge;

    // Small terminals shrink the fixed rows before any height goes negative
    void calculate(int tw, int th);
};

// Cells of a gauge bar that are filled for a given ratio
int gauge_fill_cells(float ratio, int width);

} // namespace gpudash::tui
