#include "layout.hpp"
#include <algorithm>
#include <cmath>

namespace gpudash::tui {

void LayoutDimensions::calculate(int tw, int th) {
    term_width = std::max(tw, 0);
    term_height = std::max(th, 0);

    // Header, footer, then whatever is left for the body
    int header_rows = std::min(header_height, term_height);
    int footer_rows = std::min(footer_height, term_height - header_rows);
    int body_rows = term_height - header_rows - footer_rows;

    header = {.y = 0, .x = 0, .height = header_rows, .width = term_width};
    body = {.y = header_rows, .x = 0, .height = body_rows, .width = term_width};
    footer = {.y = header_rows + body_rows, .x = 0, .height = footer_rows, .width = term_width};

    // Body interior, one cell in from the border
    int inner_y = body.y + 1;
    int inner_height = std::max(body_rows - 2, 0);
    int inner_width = std::max(term_width - 2, 0);

    int vram_rows = std::min(gauge_height, inner_height);
    int util_rows = std::min(gauge_height, inner_height - vram_rows);
    int text_rows = inner_height - util_rows - vram_rows;

    text = {.y = inner_y, .x = 1, .height = text_rows, .width = inner_width};
    utilization_gauge = {.y = inner_y + text_rows, .x = 1, .height = util_rows, .width = inner_width};
    vram_gauge = {.y = inner_y + text_rows + util_rows, .x = 1, .height = vram_rows, .width = inner_width};
}

int gauge_fill_cells(float ratio, int width) {
    if (width <= 0 || !(ratio > 0.0f)) {
        return 0;
    }
    float clamped = std::min(ratio, 1.0f);
    int cells = static_cast<int>(std::lround(clamped * static_cast<float>(width)));
    return std::clamp(cells, 0, width);
}

} // namespace gpudash::tui
