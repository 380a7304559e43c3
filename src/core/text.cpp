#include "termtoast/text.hpp"
#include <algorithm>
#include <cstdint>

namespace termtoast {

namespace {

// Length of the UTF-8 sequence introduced by a lead byte (1 for invalid bytes)
size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

uint32_t decode(std::string_view glyph) {
    if (glyph.empty()) {
        return 0;
    }
    const auto* bytes = reinterpret_cast<const unsigned char*>(glyph.data());
    switch (glyph.size()) {
        case 2: return ((bytes[0] & 0x1Fu) << 6) | (bytes[1] & 0x3Fu);
        case 3: return ((bytes[0] & 0x0Fu) << 12) | ((bytes[1] & 0x3Fu) << 6) | (bytes[2] & 0x3Fu);
        case 4: return ((bytes[0] & 0x07u) << 18) | ((bytes[1] & 0x3Fu) << 12) |
                       ((bytes[2] & 0x3Fu) << 6) | (bytes[3] & 0x3Fu);
        default: return bytes[0];
    }
}

bool is_zero_width(uint32_t cp) {
    return (cp >= 0x0300 && cp <= 0x036F) ||   // combining diacritics
           (cp >= 0x200B && cp <= 0x200F) ||   // zero width space, joiners, marks
           (cp >= 0xFE00 && cp <= 0xFE0F);     // variation selectors
}

bool is_wide(uint32_t cp) {
    return (cp >= 0x1100 && cp <= 0x115F) ||
           (cp >= 0x2E80 && cp <= 0xA4CF && cp != 0x303F) ||
           (cp >= 0xAC00 && cp <= 0xD7A3) ||
           (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF00 && cp <= 0xFF60) ||
           (cp >= 0xFFE0 && cp <= 0xFFE6) ||
           (cp >= 0x1F300 && cp <= 0x1F64F) ||
           (cp >= 0x1F900 && cp <= 0x1F9FF) ||
           (cp >= 0x20000 && cp <= 0x3FFFD);
}

// Append `word` to `lines`, breaking it into width-sized chunks.
// The last chunk stays in `current`.
void break_word(const std::string& word, uint16_t width,
                std::vector<std::string>& lines, std::string& current, uint16_t& current_width) {
    for (const auto& glyph : split_glyphs(word)) {
        uint16_t w = glyph_width(glyph);
        if (current_width + w > width && !current.empty()) {
            lines.push_back(current);
            current.clear();
            current_width = 0;
        }
        current += glyph;
        current_width = static_cast<uint16_t>(current_width + w);
    }
}

} // anonymous namespace

std::vector<std::string> split_glyphs(std::string_view text) {
    std::vector<std::string> glyphs;
    size_t i = 0;
    while (i < text.size()) {
        size_t len = sequence_length(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) {
            len = 1;
        }
        glyphs.emplace_back(text.substr(i, len));
        i += len;
    }
    return glyphs;
}

uint16_t glyph_width(std::string_view glyph) {
    uint32_t cp = decode(glyph);
    if (cp < 0x20 || cp == 0x7F || is_zero_width(cp)) {
        return 0;
    }
    return is_wide(cp) ? 2 : 1;
}

uint16_t display_width(std::string_view text) {
    uint32_t total = 0;
    for (const auto& glyph : split_glyphs(text)) {
        total += glyph_width(glyph);
    }
    return static_cast<uint16_t>(std::min<uint32_t>(total, UINT16_MAX));
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        std::string_view line = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return lines;
}

std::vector<std::string> wrap_text(std::string_view text, uint16_t width) {
    std::vector<std::string> lines;
    if (width == 0) {
        return split_lines(text);
    }

    for (const auto& source_line : split_lines(text)) {
        std::string current;
        uint16_t current_width = 0;
        bool line_started = false;

        size_t start = 0;
        while (start <= source_line.size()) {
            size_t end = source_line.find(' ', start);
            if (end == std::string::npos) {
                end = source_line.size();
            }
            std::string word = source_line.substr(start, end - start);
            start = end + 1;

            if (word.empty()) {
                if (end == source_line.size()) {
                    break;
                }
                continue;
            }

            uint16_t word_width = display_width(word);
            if (line_started && current_width + 1 + word_width <= width) {
                current += ' ';
                current += word;
                current_width = static_cast<uint16_t>(current_width + 1 + word_width);
            } else {
                if (line_started) {
                    lines.push_back(current);
                    current.clear();
                    current_width = 0;
                }
                if (word_width <= width) {
                    current = word;
                    current_width = word_width;
                } else {
                    break_word(word, width, lines, current, current_width);
                }
                line_started = true;
            }
        }

        lines.push_back(current);
    }

    return lines;
}

std::string truncate_to_width(std::string_view text, uint16_t width) {
    std::string result;
    uint16_t used = 0;
    for (const auto& glyph : split_glyphs(text)) {
        uint16_t w = glyph_width(glyph);
        if (used + w > width) {
            break;
        }
        result += glyph;
        used = static_cast<uint16_t>(used + w);
    }
    return result;
}

} // namespace termtoast
