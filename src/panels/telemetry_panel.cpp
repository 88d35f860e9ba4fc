#include "panels/telemetry_panel.hpp"
#include "utils/colors.hpp"
#include "utils/logger.hpp"
#include <algorithm>

namespace gpudash::tui {

TelemetryPanel::TelemetryPanel() : BasePanel("telemetry", "Devices") {
}

void TelemetryPanel::set_layout(const LayoutDimensions& layout) {
    set_region(layout.body);
    text_ = to_local(layout.text);
    utilization_ = to_local(layout.utilization_gauge);
    vram_ = to_local(layout.vram_gauge);
}

Region TelemetryPanel::to_local(const Region& r) const {
    return Region{
        .y = r.y - region_.y,
        .x = r.x - region_.x,
        .height = r.height,
        .width = r.width
    };
}

void TelemetryPanel::render(WINDOW* window) {
    werase(window);
    draw_border(window);
    draw_title(window, display_name_);

    render_lines(window);
    render_gauge(window, utilization_, body_.utilization);
    render_gauge(window, vram_, body_.vram);
}

void TelemetryPanel::render_lines(WINDOW* window) {
    int rows = std::min<int>(text_.height, static_cast<int>(body_.lines.size()));

    for (int i = 0; i < rows; ++i) {
        const auto& line = body_.lines[i];
        int pair = line.color ? colors::pair_for(*line.color) : colors::TEXT_PRIMARY;

        wattron(window, COLOR_PAIR(pair));
        draw_text(window, text_.y + i, text_.x + 1, line.text, text_.width - 2);
        wattroff(window, COLOR_PAIR(pair));
    }
}

void TelemetryPanel::render_gauge(WINDOW* window, const Region& area, const Gauge& gauge) {
    if (area.height < 3 || area.width < 4) {
        return;
    }

    int pair = colors::pair_for(gauge.color);

    // Gauge frame in the severity color
    wattron(window, COLOR_PAIR(pair));
    mvwhline(window, area.y, area.x + 1, ACS_HLINE, area.width - 2);
    mvwhline(window, area.y + 2, area.x + 1, ACS_HLINE, area.width - 2);
    mvwaddch(window, area.y, area.x, ACS_ULCORNER);
    mvwaddch(window, area.y, area.x + area.width - 1, ACS_URCORNER);
    mvwaddch(window, area.y + 1, area.x, ACS_VLINE);
    mvwaddch(window, area.y + 1, area.x + area.width - 1, ACS_VLINE);
    mvwaddch(window, area.y + 2, area.x, ACS_LLCORNER);
    mvwaddch(window, area.y + 2, area.x + area.width - 1, ACS_LRCORNER);
    wattroff(window, COLOR_PAIR(pair));

    wattron(window, COLOR_PAIR(pair) | A_BOLD);
    draw_text(window, area.y, area.x + 2, " " + gauge.title + " ", area.width - 4);
    wattroff(window, COLOR_PAIR(pair) | A_BOLD);

    // Bar with the label centered over it
    int bar_width = area.width - 2;
    int filled = gauge_fill_cells(gauge.ratio, bar_width);
    int label_len = std::min<int>(static_cast<int>(gauge.label.size()), bar_width);
    int label_start = (bar_width - label_len) / 2;

    for (int col = 0; col < bar_width; ++col) {
        char ch = ' ';
        if (col >= label_start && col < label_start + label_len) {
            ch = gauge.label[col - label_start];
        }

        attr_t attrs = COLOR_PAIR(pair);
        if (col < filled) {
            attrs |= A_REVERSE;
        }
        if (ch != ' ') {
            attrs |= A_BOLD;
        }

        wattron(window, attrs);
        mvwaddch(window, area.y + 1, area.x + 1 + col, static_cast<chtype>(static_cast<unsigned char>(ch)));
        wattroff(window, attrs);
    }
}

} // namespace gpudash::tui
