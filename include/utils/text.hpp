#pragma once

#include <string>

namespace gpudash::tui {

// Columns taken by UTF-8 text. Every glyph the dashboard prints is one column wide,
// so this is the number of code points.
int display_width(const std::string& text);

// Longest prefix that fits in max_cols columns, never splitting a multi-byte character
std::string clip_to_width(const std::string& text, int max_cols);

} // namespace gpudash::tui
