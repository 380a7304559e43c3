#include "termtoast/frame.hpp"

namespace termtoast {

BorderSet border_set_for(BorderType border_type) {
    switch (border_type) {
        case BorderType::Plain:
            return BorderSet{"┌", "┐", "└", "┘", "│", "│", "─", "─"};
        case BorderType::Rounded:
            return BorderSet{"╭", "╮", "╰", "╯", "│", "│", "─", "─"};
        case BorderType::Double:
            return BorderSet{"╔", "╗", "╚", "╝", "║", "║", "═", "═"};
        case BorderType::Thick:
            return BorderSet{"┏", "┓", "┗", "┛", "┃", "┃", "━", "━"};
    }
    return BorderSet{"┌", "┐", "└", "┘", "│", "│", "─", "─"};
}

uint16_t border_thickness(const std::optional<BorderType>& border_type) {
    // Every border style draws a single glyph per side
    return border_type ? 1 : 0;
}

} // namespace termtoast
