#include "input.hpp"
#include <ncurses.h>

namespace gpudash::tui {

InputEvent classify_input(int ch) {
    switch (ch) {
        case ERR:
            return {.kind = InputKind::TIMEOUT, .code = ch};
        case KEY_RESIZE:
            return {.kind = InputKind::RESIZE, .code = ch};
        case KEY_MOUSE:
            return {.kind = InputKind::OTHER, .code = ch};
        default:
            return {.kind = InputKind::KEY, .code = ch};
    }
}

std::string input_kind_to_string(InputKind kind) {
    switch (kind) {
        case InputKind::TIMEOUT: return "TIMEOUT";
        case InputKind::KEY:     return "KEY";
        case InputKind::RESIZE:  return "RESIZE";
        case InputKind::OTHER:   return "OTHER";
    }
    return "UNKNOWN";
}

} // namespace gpudash::tui
