#include "termtoast/size_calculator.hpp"
#include "termtoast/frame.hpp"
#include "termtoast/styles.hpp"
#include "termtoast/text.hpp"
#include <algorithm>
#include <string>

namespace termtoast {

namespace {

uint16_t clamp_dimension(uint32_t natural, uint16_t max, uint16_t min) {
    uint32_t value = std::min<uint32_t>(natural, max);
    return static_cast<uint16_t>(std::max<uint32_t>(value, min));
}

} // anonymous namespace

std::pair<uint16_t, uint16_t> calculate_size(const Notification& notification, const Rect& frame_area) {
    const uint16_t thickness = border_thickness(notification.border_type());
    const Padding padding = notification.padding();

    uint16_t content_width = 0;
    for (const auto& line : split_lines(notification.content())) {
        content_width = std::max(content_width, display_width(line));
    }
    const std::string title = title_line(notification);
    const uint16_t title_width = display_width(title);

    // Without a border the title takes a row of its own above the content
    const uint32_t title_rows = (!notification.border_type() && !title.empty()) ? 1u : 0u;

    const uint32_t horizontal_chrome = static_cast<uint32_t>(padding.left) + padding.right + 2u * thickness;
    const uint32_t vertical_chrome = static_cast<uint32_t>(padding.top) + padding.bottom + 2u * thickness +
                                     title_rows;

    const uint16_t max_width = notification.max_width()
        ? notification.max_width()->resolve(frame_area.width)
        : frame_area.width;
    const uint16_t max_height = notification.max_height()
        ? notification.max_height()->resolve(frame_area.height)
        : frame_area.height;

    const uint16_t width = clamp_dimension(std::max(content_width, title_width) + horizontal_chrome,
                                           max_width, MIN_NOTIFICATION_WIDTH);

    // Height depends on how the content wraps at the final width
    const uint16_t inner_width = width > horizontal_chrome
        ? static_cast<uint16_t>(width - horizontal_chrome)
        : 1;
    const size_t line_count = wrap_text(notification.content(), inner_width).size();

    const uint16_t height = clamp_dimension(static_cast<uint32_t>(line_count) + vertical_chrome,
                                            max_height, MIN_NOTIFICATION_HEIGHT);

    return {width, height};
}

} // namespace termtoast
