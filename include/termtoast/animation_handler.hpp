#pragma once

#include "color.hpp"
#include "frame.hpp"
#include "toast_types.hpp"
#include <optional>

namespace termtoast {

class NotificationState;

// Per-animation behaviour shared by Slide, ExpandCollapse and Fade.
// Only calculate_rect is mandatory; the effect and colour hooks default to
// returning their input unchanged.
class IAnimationHandler {
public:
    virtual ~IAnimationHandler() = default;

    // Rect to draw this frame (may be empty while off screen)
    virtual Rect calculate_rect(const NotificationState& state, const Rect& frame_area) const = 0;

    // Adjust border glyphs for the current phase/progress
    virtual BorderSet apply_block_effect(const BorderSet& border_set,
                                         const NotificationState& state,
                                         const Rect& frame_area) const {
        (void)state;
        (void)frame_area;
        return border_set;
    }

    virtual std::optional<Color> interpolate_frame_foreground(std::optional<Color> base,
                                                              AnimationPhase phase,
                                                              float progress) const {
        (void)phase;
        (void)progress;
        return base;
    }

    virtual std::optional<Color> interpolate_content_foreground(std::optional<Color> base,
                                                                AnimationPhase phase,
                                                                float progress) const {
        (void)phase;
        (void)progress;
        return base;
    }
};

class SlideHandler : public IAnimationHandler {
public:
    Rect calculate_rect(const NotificationState& state, const Rect& frame_area) const override;
    BorderSet apply_block_effect(const BorderSet& border_set,
                                 const NotificationState& state,
                                 const Rect& frame_area) const override;
};

class ExpandCollapseHandler : public IAnimationHandler {
public:
    Rect calculate_rect(const NotificationState& state, const Rect& frame_area) const override;
};

class FadeHandler : public IAnimationHandler {
public:
    Rect calculate_rect(const NotificationState& state, const Rect& frame_area) const override;
    std::optional<Color> interpolate_frame_foreground(std::optional<Color> base,
                                                      AnimationPhase phase,
                                                      float progress) const override;
    std::optional<Color> interpolate_content_foreground(std::optional<Color> base,
                                                        AnimationPhase phase,
                                                        float progress) const override;
};

// Shared stateless handler instance for an animation kind
const IAnimationHandler& get_animation_handler(Animation animation);

// Slide: interpolate between an off-screen point and full_rect, then clip to
// the frame. Entry uses ease-out, exit ease-in. custom_start/custom_end
// replace the computed off-screen points. Any phase other than
// SlidingIn/SlidingOut returns full_rect.
Rect slide_calculate_rect(const Rect& full_rect, const Rect& frame_area,
                          float progress, AnimationPhase phase,
                          Anchor anchor, SlideDirection direction,
                          std::optional<PointF> custom_start,
                          std::optional<PointF> custom_end);

// Slide: blank the border on every edge that currently crosses the frame
// boundary along the slide direction, turning the neighbouring corners into
// straight segments of the perpendicular border.
BorderSet slide_apply_border_effect(const BorderSet& border_set,
                                    const Rect& full_rect, const Rect& frame_area,
                                    float progress, AnimationPhase phase,
                                    Anchor anchor, SlideDirection direction,
                                    std::optional<PointF> custom_start,
                                    std::optional<PointF> custom_end);

// ExpandCollapse: grow from (or shrink to) a 3x3 box centred on full_rect
Rect expand_calculate_rect(const Rect& full_rect, const Rect& frame_area,
                           AnimationPhase phase, float progress);

// Fade never moves the box
Rect fade_calculate_rect(const Rect& full_rect, const Rect& frame_area);

} // namespace termtoast
