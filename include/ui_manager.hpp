#pragma once

#include "frame.hpp"
#include "input.hpp"
#include "layout.hpp"
#include "panels/telemetry_panel.hpp"
#include "terminal_session.hpp"
#include <ncurses.h>
#include <memory>

namespace gpudash::tui {

class UIManager {
public:
    UIManager();
    ~UIManager();

    // Initialization. init() opens the terminal session and throws if it can't.
    void init(const TerminalDevice& device = {});
    void shutdown();
    bool initialized() const { return initialized_; }

    // Layout management
    void update_layout();

    // Draws a whole frame. Throws std::runtime_error if the terminal refuses the update.
    void draw(const Frame& frame);

    // Blocks for at most timeout_ms
    InputEvent poll_input(int timeout_ms);

    // Terminal info
    const LayoutDimensions& layout() const { return layout_; }

private:
    std::unique_ptr<TerminalSession> session_;

    // Windows
    WINDOW* header_win_ = nullptr;
    WINDOW* body_win_ = nullptr;
    WINDOW* footer_win_ = nullptr;

    // Layout
    LayoutDimensions layout_;

    TelemetryPanel telemetry_panel_;

    // State
    bool initialized_ = false;

    // Helper methods
    void create_windows();
    void destroy_windows();
    void render_header(const HeaderBlock& header);
    void render_body(const BodyBlock& body);
    void render_footer(const FooterBlock& footer);
};

} // namespace gpudash::tui
