#pragma once

#include <cstdint>
#include <optional>

namespace termtoast {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
};

// Terminal colour: terminal default, 16 named ANSI colours, 256-colour palette or true colour
struct Color {
    enum class Type : uint8_t {
        Reset,
        Black,
        Red,
        Green,
        Yellow,
        Blue,
        Magenta,
        Cyan,
        Gray,
        DarkGray,
        LightRed,
        LightGreen,
        LightYellow,
        LightBlue,
        LightMagenta,
        LightCyan,
        White,
        Indexed,
        Rgb
    };

    Type type = Type::Reset;
    uint8_t index = 0;      // Indexed only
    uint8_t r = 0;          // Rgb only
    uint8_t g = 0;
    uint8_t b = 0;

    Color() = default;
    Color(Type t) : type(t) {}

    static Color rgb(uint8_t r, uint8_t g, uint8_t b) {
        Color c(Type::Rgb);
        c.r = r;
        c.g = g;
        c.b = b;
        return c;
    }

    static Color indexed(uint8_t i) {
        Color c(Type::Indexed);
        c.index = i;
        return c;
    }

    bool operator==(const Color& other) const {
        if (type != other.type) return false;
        if (type == Type::Indexed) return index == other.index;
        if (type == Type::Rgb) return r == other.r && g == other.g && b == other.b;
        return true;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// RGB value of a colour; empty for Reset and Indexed (no fixed RGB form)
std::optional<Rgb> color_to_rgb(const Color& color);

enum Modifier : uint16_t {
    MOD_NONE = 0,
    MOD_BOLD = 1 << 0,
    MOD_DIM = 1 << 1,
    MOD_ITALIC = 1 << 2,
    MOD_UNDERLINED = 1 << 3,
    MOD_REVERSED = 1 << 4
};

struct Style {
    std::optional<Color> fg;
    std::optional<Color> bg;
    uint16_t add_modifier = MOD_NONE;

    Style& set_fg(const Color& color) { fg = color; return *this; }
    Style& set_bg(const Color& color) { bg = color; return *this; }
    Style& set_modifier(uint16_t modifier) { add_modifier |= modifier; return *this; }

    // Fields set in `other` override ours
    Style patch(const Style& other) const {
        Style result = *this;
        if (other.fg) result.fg = other.fg;
        if (other.bg) result.bg = other.bg;
        result.add_modifier |= other.add_modifier;
        return result;
    }

    bool operator==(const Style& other) const {
        return fg == other.fg && bg == other.bg && add_modifier == other.add_modifier;
    }
    bool operator!=(const Style& other) const { return !(*this == other); }

    static Style with_fg(const Color& color) { Style s; s.fg = color; return s; }
};

} // namespace termtoast
