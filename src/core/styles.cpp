#include "termtoast/styles.hpp"

namespace termtoast {

Color level_color(Level level) {
    switch (level) {
        case Level::Info: return Color::Type::Green;
        case Level::Warn: return Color::Type::Yellow;
        case Level::Error: return Color::Type::Red;
        case Level::Debug: return Color::Type::Blue;
        case Level::Trace: return Color::Type::Magenta;
    }
    return Color::Type::DarkGray;
}

ResolvedStyles resolve_styles(std::optional<Level> level,
                              const std::optional<Style>& block_style,
                              const std::optional<Style>& border_style,
                              const std::optional<Style>& title_style) {
    ResolvedStyles styles;
    styles.block = block_style.value_or(Style{});

    if (border_style) {
        styles.border = *border_style;
    } else if (level) {
        styles.border = Style::with_fg(level_color(*level));
    } else {
        styles.border = Style::with_fg(Color::Type::DarkGray);
    }

    if (title_style) {
        styles.title = *title_style;
    } else if (level || border_style) {
        // Title follows the border colour
        if (styles.border.fg) {
            styles.title = Style::with_fg(*styles.border.fg);
        }
    }

    return styles;
}

const char* get_level_icon(std::optional<Level> level) {
    if (!level) {
        return nullptr;
    }
    switch (*level) {
        case Level::Info: return " ℹ";
        case Level::Warn: return " ⚠";
        case Level::Error: return " ✖";
        case Level::Debug: return " 🐞";
        case Level::Trace: return " ⊙";
    }
    return nullptr;
}

std::string title_line(const Notification& notification) {
    if (!notification.title()) {
        return {};
    }
    const char* icon = get_level_icon(notification.level());
    if (!icon) {
        return *notification.title();
    }
    return std::string(icon) + " " + *notification.title();
}

} // namespace termtoast
