#pragma once

#include <string>

namespace gpudash::tui {

enum class InputKind {
    TIMEOUT,  // nothing arrived before the poll timeout
    KEY,      // a key press
    RESIZE,   // terminal size changed
    OTHER     // mouse and other non-key events
};

struct InputEvent {
    InputKind kind = InputKind::TIMEOUT;
    int code = 0;
};

// Maps a getch() result to an event
InputEvent classify_input(int ch);

std::string input_kind_to_string(InputKind kind);

} // namespace gpudash::tui
