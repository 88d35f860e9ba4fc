#include "utils/text.hpp"

namespace gpudash::tui {

namespace {

// Continuation bytes look like 10xxxxxx
bool starts_character(char byte) {
    return (static_cast<unsigned char>(byte) & 0xC0) != 0x80;
}

} // namespace

int display_width(const std::string& text) {
    int cols = 0;
    for (char byte : text) {
        if (starts_character(byte)) {
            ++cols;
        }
    }
    return cols;
}

std::string clip_to_width(const std::string& text, int max_cols) {
    if (max_cols <= 0) {
        return {};
    }

    int cols = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!starts_character(text[i])) {
            continue;
        }
        if (cols == max_cols) {
            return text.substr(0, i);
        }
        ++cols;
    }
    return text;
}

} // namespace gpudash::tui
