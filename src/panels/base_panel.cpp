#include "panels/base_panel.hpp"
#include "utils/logger.hpp"
#include "utils/colors.hpp"
#include "utils/text.hpp"
#include <algorithm>

namespace gpudash::tui {

BasePanel::BasePanel(const std::string& id, const std::string& display_name)
    : panel_id_(id), display_name_(display_name) {
    LOG_DEBUG("Panel", "Created: " + panel_id_);
}

void BasePanel::draw_border(WINDOW* window) {
    wattron(window, COLOR_PAIR(colors::BORDER));
    box(window, 0, 0);
    wattroff(window, COLOR_PAIR(colors::BORDER));
}

void BasePanel::draw_title(WINDOW* window, const std::string& title) {
    int width = getmaxx(window);
    if (width < 6) return;

    wattron(window, COLOR_PAIR(colors::BORDER) | A_BOLD);
    draw_text(window, 0, 2, " " + title + " ", width - 4);
    wattroff(window, COLOR_PAIR(colors::BORDER) | A_BOLD);
}

void BasePanel::draw_text(WINDOW* window, int y, int x, const std::string& text, int max_width) {
    int height = getmaxy(window);
    int width = getmaxx(window);
    if (y < 0 || y >= height || x < 0 || x >= width || max_width <= 0) {
        return;
    }

    int room = std::min(max_width, width - x);
    mvwaddstr(window, y, x, clip_to_width(text, room).c_str());
}

} // namespace gpudash::tui
