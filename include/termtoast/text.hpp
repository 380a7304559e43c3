#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace termtoast {

// UTF-8 helpers for measuring and laying out terminal text.
// Widths are in terminal cells; East Asian wide and emoji code points count 2.

// Split into code point substrings (invalid bytes come through one at a time)
std::vector<std::string> split_glyphs(std::string_view text);

// Cell width of a single code point substring
uint16_t glyph_width(std::string_view glyph);

// Cell width of a whole line (no newline handling)
uint16_t display_width(std::string_view text);

// Split on '\n' (a trailing '\r' is dropped)
std::vector<std::string> split_lines(std::string_view text);

// Greedy word wrap to `width` cells. Words longer than the width are broken.
// Explicit newlines are kept; an empty input yields a single empty line.
std::vector<std::string> wrap_text(std::string_view text, uint16_t width);

// Longest prefix that fits in `width` cells
std::string truncate_to_width(std::string_view text, uint16_t width);

} // namespace termtoast
