#include "termtoast/layout.hpp"
#include <algorithm>

namespace termtoast {

namespace {

enum class Align { Start, Center, End };

Align horizontal_align(Anchor anchor) {
    switch (anchor) {
        case Anchor::TopLeft:
        case Anchor::MiddleLeft:
        case Anchor::BottomLeft:
            return Align::Start;
        case Anchor::TopCenter:
        case Anchor::MiddleCenter:
        case Anchor::BottomCenter:
            return Align::Center;
        case Anchor::TopRight:
        case Anchor::MiddleRight:
        case Anchor::BottomRight:
            return Align::End;
    }
    return Align::Start;
}

Align vertical_align(Anchor anchor) {
    if (is_top_anchor(anchor)) {
        return Align::Start;
    }
    if (is_bottom_anchor(anchor)) {
        return Align::End;
    }
    return Align::Center;
}

uint16_t align_position(Align align, uint16_t origin, uint16_t extent) {
    switch (align) {
        case Align::Start: return origin;
        case Align::Center: return static_cast<uint16_t>(origin + extent / 2);
        case Align::End: return static_cast<uint16_t>(origin + (extent > 0 ? extent - 1 : 0));
    }
    return origin;
}

// Start coordinate of a span of `size` cells aligned on `anchor_coord`,
// kept inside [lo, hi - size]
uint16_t place_span(Align align, uint16_t anchor_coord, uint16_t size, uint16_t pad,
                    uint16_t lo, uint16_t hi) {
    int start = anchor_coord;
    switch (align) {
        case Align::Start:
            start = anchor_coord + pad;
            break;
        case Align::Center:
            start = anchor_coord - size / 2;
            break;
        case Align::End:
            start = anchor_coord + 1 - size - pad;
            break;
    }
    int max_start = static_cast<int>(hi) - size;
    start = std::min(start, max_start);
    start = std::max(start, static_cast<int>(lo));
    return static_cast<uint16_t>(start);
}

} // anonymous namespace

bool is_top_anchor(Anchor anchor) {
    return anchor == Anchor::TopLeft || anchor == Anchor::TopCenter || anchor == Anchor::TopRight;
}

bool is_bottom_anchor(Anchor anchor) {
    return anchor == Anchor::BottomLeft || anchor == Anchor::BottomCenter || anchor == Anchor::BottomRight;
}

Position calculate_anchor_position(Anchor anchor, const Rect& frame) {
    return Position{align_position(horizontal_align(anchor), frame.x, frame.width),
                    align_position(vertical_align(anchor), frame.y, frame.height)};
}

SlideDirection resolve_slide_direction(SlideDirection direction, Anchor anchor) {
    if (direction != SlideDirection::Default) {
        return direction;
    }

    switch (anchor) {
        case Anchor::TopLeft: return SlideDirection::FromTopLeft;
        case Anchor::TopCenter: return SlideDirection::FromTop;
        case Anchor::TopRight: return SlideDirection::FromTopRight;
        case Anchor::MiddleLeft: return SlideDirection::FromLeft;
        case Anchor::MiddleCenter: return SlideDirection::FromLeft;
        case Anchor::MiddleRight: return SlideDirection::FromRight;
        case Anchor::BottomLeft: return SlideDirection::FromBottomLeft;
        case Anchor::BottomCenter: return SlideDirection::FromBottom;
        case Anchor::BottomRight: return SlideDirection::FromBottomRight;
    }
    return SlideDirection::FromLeft;
}

PointF slide_offscreen_position(SlideDirection direction,
                                const Rect& full_rect, const Rect& frame_area) {
    const float left = static_cast<float>(frame_area.x) - full_rect.width - 1.0f;
    const float right = static_cast<float>(frame_area.right()) + 1.0f;
    const float above = static_cast<float>(frame_area.y) - full_rect.height - 1.0f;
    const float below = static_cast<float>(frame_area.bottom()) + 1.0f;
    const float x = full_rect.x;
    const float y = full_rect.y;

    switch (direction) {
        case SlideDirection::FromLeft: return PointF{left, y};
        case SlideDirection::FromRight: return PointF{right, y};
        case SlideDirection::FromTop: return PointF{x, above};
        case SlideDirection::FromBottom: return PointF{x, below};
        case SlideDirection::FromTopLeft: return PointF{left, above};
        case SlideDirection::FromTopRight: return PointF{right, above};
        case SlideDirection::FromBottomLeft: return PointF{left, below};
        case SlideDirection::FromBottomRight: return PointF{right, below};
        case SlideDirection::Default: break;
    }
    return PointF{x, y};
}

Rect calculate_rect(Anchor anchor, const Position& anchor_pos,
                    uint16_t width, uint16_t height,
                    const Rect& frame, uint16_t exterior_padding) {
    const uint16_t w = std::min(width, frame.width);
    const uint16_t h = std::min(height, frame.height);

    const Align h_align = horizontal_align(anchor);
    const Align v_align = vertical_align(anchor);

    // Margin only applies along an axis that touches a frame edge
    const uint16_t h_pad = h_align == Align::Center ? 0 : exterior_padding;
    const uint16_t v_pad = v_align == Align::Center ? 0 : exterior_padding;

    return Rect{place_span(h_align, anchor_pos.x, w, h_pad, frame.x, frame.right()),
                place_span(v_align, anchor_pos.y, h, v_pad, frame.y, frame.bottom()),
                w, h};
}

} // namespace termtoast
