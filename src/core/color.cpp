#include "termtoast/color.hpp"

namespace termtoast {

std::optional<Rgb> color_to_rgb(const Color& color) {
    switch (color.type) {
        case Color::Type::Black: return Rgb{0, 0, 0};
        case Color::Type::Red: return Rgb{128, 0, 0};
        case Color::Type::Green: return Rgb{0, 128, 0};
        case Color::Type::Yellow: return Rgb{128, 128, 0};
        case Color::Type::Blue: return Rgb{0, 0, 128};
        case Color::Type::Magenta: return Rgb{128, 0, 128};
        case Color::Type::Cyan: return Rgb{0, 128, 128};
        case Color::Type::Gray: return Rgb{192, 192, 192};
        case Color::Type::DarkGray: return Rgb{128, 128, 128};
        case Color::Type::LightRed: return Rgb{255, 0, 0};
        case Color::Type::LightGreen: return Rgb{0, 255, 0};
        case Color::Type::LightYellow: return Rgb{255, 255, 0};
        case Color::Type::LightBlue: return Rgb{0, 0, 255};
        case Color::Type::LightMagenta: return Rgb{255, 0, 255};
        case Color::Type::LightCyan: return Rgb{0, 255, 255};
        case Color::Type::White: return Rgb{255, 255, 255};
        case Color::Type::Rgb: return Rgb{color.r, color.g, color.b};
        case Color::Type::Reset:
        case Color::Type::Indexed:
            break;
    }
    return std::nullopt;
}

} // namespace termtoast
