#include "termtoast/animation_handler.hpp"
#include "termtoast/layout.hpp"
#include "termtoast/math.hpp"
#include "termtoast/notification_state.hpp"
#include <algorithm>
#include <cmath>

namespace termtoast {

namespace {

constexpr float MIN_EXPAND_SIZE = 3.0f;

struct SlideEdges {
    bool left = false;
    bool right = false;
    bool top = false;
    bool bottom = false;
};

SlideEdges edges_of(SlideDirection direction) {
    SlideEdges edges;
    switch (direction) {
        case SlideDirection::FromLeft: edges.left = true; break;
        case SlideDirection::FromRight: edges.right = true; break;
        case SlideDirection::FromTop: edges.top = true; break;
        case SlideDirection::FromBottom: edges.bottom = true; break;
        case SlideDirection::FromTopLeft: edges.top = edges.left = true; break;
        case SlideDirection::FromTopRight: edges.top = edges.right = true; break;
        case SlideDirection::FromBottomLeft: edges.bottom = edges.left = true; break;
        case SlideDirection::FromBottomRight: edges.bottom = edges.right = true; break;
        case SlideDirection::Default: break;
    }
    return edges;
}

bool is_sliding(AnimationPhase phase) {
    return phase == AnimationPhase::SlidingIn || phase == AnimationPhase::SlidingOut;
}

// Top-left corner of the moving box, not yet clipped to the frame.
// Only meaningful while sliding.
PointF slide_origin(const Rect& full_rect, const Rect& frame_area,
                    float progress, AnimationPhase phase,
                    SlideDirection resolved,
                    const std::optional<PointF>& custom_start,
                    const std::optional<PointF>& custom_end) {
    const PointF full{static_cast<float>(full_rect.x), static_cast<float>(full_rect.y)};
    const PointF offscreen = slide_offscreen_position(resolved, full_rect, frame_area);
    const float t = std::clamp(progress, 0.0f, 1.0f);

    PointF from;
    PointF to;
    float eased;
    if (phase == AnimationPhase::SlidingIn) {
        from = custom_start.value_or(offscreen);
        to = full;
        eased = ease_out_quad(t);
    } else {
        from = full;
        to = custom_end.value_or(offscreen);
        eased = ease_in_quad(t);
    }

    return PointF{std::round(lerp(from.x, to.x, eased)),
                  std::round(lerp(from.y, to.y, eased))};
}

} // anonymous namespace

Rect slide_calculate_rect(const Rect& full_rect, const Rect& frame_area,
                          float progress, AnimationPhase phase,
                          Anchor anchor, SlideDirection direction,
                          std::optional<PointF> custom_start,
                          std::optional<PointF> custom_end) {
    if (!is_sliding(phase)) {
        return full_rect;
    }

    const SlideDirection resolved = resolve_slide_direction(direction, anchor);
    const PointF origin = slide_origin(full_rect, frame_area, progress, phase,
                                       resolved, custom_start, custom_end);

    // Clip against the frame in signed space; the box may sit partly off screen
    const int x1 = std::max(static_cast<int>(origin.x), static_cast<int>(frame_area.x));
    const int y1 = std::max(static_cast<int>(origin.y), static_cast<int>(frame_area.y));
    const int x2 = std::min(static_cast<int>(origin.x) + full_rect.width, static_cast<int>(frame_area.right()));
    const int y2 = std::min(static_cast<int>(origin.y) + full_rect.height, static_cast<int>(frame_area.bottom()));

    if (x2 <= x1 || y2 <= y1) {
        return Rect{};
    }

    return Rect{static_cast<uint16_t>(x1), static_cast<uint16_t>(y1),
                static_cast<uint16_t>(x2 - x1), static_cast<uint16_t>(y2 - y1)};
}

BorderSet slide_apply_border_effect(const BorderSet& border_set,
                                    const Rect& full_rect, const Rect& frame_area,
                                    float progress, AnimationPhase phase,
                                    Anchor anchor, SlideDirection direction,
                                    std::optional<PointF> custom_start,
                                    std::optional<PointF> custom_end) {
    if (!is_sliding(phase)) {
        return border_set;
    }

    const SlideDirection resolved = resolve_slide_direction(direction, anchor);
    const PointF origin = slide_origin(full_rect, frame_area, progress, phase,
                                       resolved, custom_start, custom_end);
    const SlideEdges edges = edges_of(resolved);

    const float left = origin.x;
    const float top = origin.y;
    const float right = origin.x + full_rect.width;
    const float bottom = origin.y + full_rect.height;

    const bool cut_left = edges.left && left < frame_area.x;
    const bool cut_right = edges.right && right > frame_area.right();
    const bool cut_top = edges.top && top < frame_area.y;
    const bool cut_bottom = edges.bottom && bottom > frame_area.bottom();

    BorderSet result = border_set;

    if (cut_right) {
        result.vertical_right = " ";
        result.top_right = border_set.horizontal_top;
        result.bottom_right = border_set.horizontal_bottom;
    }
    if (cut_left) {
        result.vertical_left = " ";
        result.top_left = border_set.horizontal_top;
        result.bottom_left = border_set.horizontal_bottom;
    }
    if (cut_top) {
        result.horizontal_top = " ";
        result.top_left = cut_left ? " " : border_set.vertical_left;
        result.top_right = cut_right ? " " : border_set.vertical_right;
    }
    if (cut_bottom) {
        result.horizontal_bottom = " ";
        result.bottom_left = cut_left ? " " : border_set.vertical_left;
        result.bottom_right = cut_right ? " " : border_set.vertical_right;
    }

    return result;
}

Rect expand_calculate_rect(const Rect& full_rect, const Rect& frame_area,
                           AnimationPhase phase, float progress) {
    if (phase != AnimationPhase::Expanding && phase != AnimationPhase::Collapsing) {
        return full_rect;
    }

    const float t = std::clamp(progress, 0.0f, 1.0f);
    const float full_w = full_rect.width;
    const float full_h = full_rect.height;
    const float min_w = std::min(MIN_EXPAND_SIZE, full_w);
    const float min_h = std::min(MIN_EXPAND_SIZE, full_h);

    float w;
    float h;
    if (phase == AnimationPhase::Expanding) {
        w = lerp(min_w, full_w, t);
        h = lerp(min_h, full_h, t);
    } else {
        w = lerp(full_w, min_w, t);
        h = lerp(full_h, min_h, t);
    }
    w = std::round(w);
    h = std::round(h);

    // Centre stays where the full rect's centre is
    const float cx = full_rect.x + full_w / 2.0f;
    const float cy = full_rect.y + full_h / 2.0f;
    const float x = std::max(0.0f, std::round(cx - w / 2.0f));
    const float y = std::max(0.0f, std::round(cy - h / 2.0f));

    Rect rect{static_cast<uint16_t>(x), static_cast<uint16_t>(y),
              static_cast<uint16_t>(w), static_cast<uint16_t>(h)};
    return rect.intersection(frame_area);
}

Rect fade_calculate_rect(const Rect& full_rect, const Rect& frame_area) {
    (void)frame_area;
    return full_rect;
}

Rect SlideHandler::calculate_rect(const NotificationState& state, const Rect& frame_area) const {
    return slide_calculate_rect(state.full_rect(), frame_area,
                                state.animation_progress(), state.current_phase(),
                                state.anchor(), state.notification().slide_direction(),
                                state.custom_entry_position(), state.custom_exit_position());
}

BorderSet SlideHandler::apply_block_effect(const BorderSet& border_set,
                                           const NotificationState& state,
                                           const Rect& frame_area) const {
    return slide_apply_border_effect(border_set, state.full_rect(), frame_area,
                                     state.animation_progress(), state.current_phase(),
                                     state.anchor(), state.notification().slide_direction(),
                                     state.custom_entry_position(), state.custom_exit_position());
}

Rect ExpandCollapseHandler::calculate_rect(const NotificationState& state, const Rect& frame_area) const {
    return expand_calculate_rect(state.full_rect(), frame_area,
                                 state.current_phase(), state.animation_progress());
}

Rect FadeHandler::calculate_rect(const NotificationState& state, const Rect& frame_area) const {
    return fade_calculate_rect(state.full_rect(), frame_area);
}

std::optional<Color> FadeHandler::interpolate_frame_foreground(std::optional<Color> base,
                                                               AnimationPhase phase,
                                                               float progress) const {
    const Color target = base.value_or(Color::Type::White);
    switch (phase) {
        case AnimationPhase::FadingIn:
        case AnimationPhase::SlidingIn:
            return interpolate_color(Color(Color::Type::Black), target, progress, true);
        case AnimationPhase::FadingOut:
        case AnimationPhase::SlidingOut:
            return interpolate_color(target, Color(Color::Type::Black), progress, false);
        default:
            return base;
    }
}

std::optional<Color> FadeHandler::interpolate_content_foreground(std::optional<Color> base,
                                                                 AnimationPhase phase,
                                                                 float progress) const {
    // Content always fades between black and white
    (void)base;
    switch (phase) {
        case AnimationPhase::FadingIn:
        case AnimationPhase::SlidingIn:
            return interpolate_color(Color(Color::Type::Black), Color(Color::Type::White), progress, true);
        case AnimationPhase::FadingOut:
        case AnimationPhase::SlidingOut:
            return interpolate_color(Color(Color::Type::White), Color(Color::Type::Black), progress, false);
        default:
            return Color(Color::Type::White);
    }
}

const IAnimationHandler& get_animation_handler(Animation animation) {
    static const SlideHandler slide;
    static const ExpandCollapseHandler expand_collapse;
    static const FadeHandler fade;

    switch (animation) {
        case Animation::Slide: return slide;
        case Animation::ExpandCollapse: return expand_collapse;
        case Animation::Fade: return fade;
    }
    return slide;
}

} // namespace termtoast
