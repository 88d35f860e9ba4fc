#include "terminal_session.hpp"
#include "utils/colors.hpp"
#include "utils/logger.hpp"
#include <clocale>
#include <cstdio>
#include <format>
#include <stdexcept>

namespace gpudash::tui {

TerminalSession::TerminalSession(const TerminalDevice& device) {
    // Needed for the degree sign and box drawing in UTF-8 terminals
    std::setlocale(LC_ALL, "");

    // Unlike initscr(), newterm() reports failure instead of exiting
    screen_ = newterm(device.term_type, device.output, device.input);
    if (!screen_) {
        throw std::runtime_error("Failed to initialize terminal (is TERM set?)");
    }
    set_term(screen_);

    if (cbreak() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
        endwin();
        delscreen(screen_);
        screen_ = nullptr;
        throw std::runtime_error("Failed to enable raw terminal input");
    }

    saved_cursor_ = curs_set(0);
    set_escdelay(25);

    colors::init_color_pairs();

    LOG_INFO("TerminalSession", std::format("Opened ({}x{})", width(), height()));
}

TerminalSession::~TerminalSession() {
    if (!screen_) return;

    if (saved_cursor_ != ERR) {
        curs_set(saved_cursor_);
    }
    endwin();
    delscreen(screen_);
    screen_ = nullptr;

    LOG_INFO("TerminalSession", "Closed");
}

int TerminalSession::width() const {
    return getmaxx(stdscr);
}

int TerminalSession::height() const {
    return getmaxy(stdscr);
}

} // namespace gpudash::tui
