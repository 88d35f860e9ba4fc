#pragma once

#include "layout.hpp"
#include <string>
#include <ncurses.h>

namespace gpudash::tui {

class BasePanel {
public:
    explicit BasePanel(const std::string& id, const std::string& display_name);
    virtual ~BasePanel() = default;

    // Region this panel's window covers, in screen coordinates
    virtual void set_region(const Region& region) { region_ = region; }

    virtual void render(WINDOW* window) = 0;

protected:
    std::string panel_id_;
    std::string display_name_;
    Region region_;

    // Helper methods for subclasses
    void draw_border(WINDOW* window);
    void draw_title(WINDOW* window, const std::string& title);

    // Clipped to the window width; nothing is drawn outside the window
    void draw_text(WINDOW* window, int y, int x, const std::string& text, int max_width);
};

} // namespace gpudash::tui
