#pragma once

#include <cstdio>
#include <ncurses.h>

namespace gpudash::tui {

// Where the session draws and reads keys. The defaults are the controlling terminal.
struct TerminalDevice {
    const char* term_type = nullptr;  // nullptr uses $TERM
    FILE* output = stdout;
    FILE* input = stdin;
};

// Owns the ncurses screen for its lifetime: raw input, alternate screen, hidden cursor.
// The destructor restores the terminal, so every exit path tears down.
class TerminalSession {
public:
    explicit TerminalSession(const TerminalDevice& device = {});
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    int width() const;
    int height() const;

private:
    SCREEN* screen_ = nullptr;
    int saved_cursor_ = ERR;
};

} // namespace gpudash::tui
