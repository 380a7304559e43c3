#pragma once

#include "notification.hpp"
#include "toast_types.hpp"
#include <utility>

namespace termtoast {

// Smallest width/height of any notification box
constexpr uint16_t MIN_NOTIFICATION_WIDTH = 3;
constexpr uint16_t MIN_NOTIFICATION_HEIGHT = 3;

// Natural size of a notification in cells: widest of content and title line,
// plus padding and border on both sides, clamped to [3, max]. Percentage
// constraints resolve against the given frame, so call again whenever the
// frame size changes. Height comes from wrapping the content to the final
// inner width.
std::pair<uint16_t, uint16_t> calculate_size(const Notification& notification, const Rect& frame_area);

} // namespace termtoast
