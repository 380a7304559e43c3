#pragma once

#include "color.hpp"
#include "notification.hpp"
#include "toast_types.hpp"
#include <optional>
#include <string>

namespace termtoast {

struct ResolvedStyles {
    Style block;
    Style border;
    Style title;
};

// Combine level colouring with user overrides.
// Border: custom, else the level colour, else DarkGray.
// Title: custom, else the border foreground (when a level or custom border
// is present), else unstyled.
ResolvedStyles resolve_styles(std::optional<Level> level,
                              const std::optional<Style>& block_style,
                              const std::optional<Style>& border_style,
                              const std::optional<Style>& title_style);

// Border colour associated with a level
Color level_color(Level level);

// Title icon for a level (with a leading space), nullptr for no level
const char* get_level_icon(std::optional<Level> level);

// Title line as drawn: level icon followed by the title text.
// Empty when the notification has no title.
std::string title_line(const Notification& notification);

} // namespace termtoast
