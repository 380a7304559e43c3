#pragma once

#include "color.hpp"
#include <optional>

namespace termtoast {

// a + (b - a) * t, no clamping
inline float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

// Starts slow, accelerates
inline float ease_in_quad(float t) {
    return t * t;
}

// Starts fast, decelerates
inline float ease_out_quad(float t) {
    return t * (2.0f - t);
}

// Interpolate between two colours using eased progress.
// fading_in selects ease-out (quick start), otherwise ease-in (lingers at `from`).
// Colours without an RGB form snap from `from` to `to` at eased t = 0.5.
// Each channel is rounded and clamped to the range spanned by the endpoints.
std::optional<Color> interpolate_color(std::optional<Color> from,
                                       std::optional<Color> to,
                                       float progress,
                                       bool fading_in);

} // namespace termtoast
