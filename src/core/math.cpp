#include "termtoast/math.hpp"
#include <algorithm>
#include <cmath>

namespace termtoast {

namespace {

uint8_t interpolate_channel(uint8_t from, uint8_t to, float t) {
    float value = std::round(lerp(static_cast<float>(from), static_cast<float>(to), t));
    float lo = static_cast<float>(std::min(from, to));
    float hi = static_cast<float>(std::max(from, to));
    return static_cast<uint8_t>(std::clamp(value, lo, hi));
}

} // anonymous namespace

std::optional<Color> interpolate_color(std::optional<Color> from,
                                       std::optional<Color> to,
                                       float progress,
                                       bool fading_in) {
    float t = std::clamp(progress, 0.0f, 1.0f);
    float eased = fading_in ? ease_out_quad(t) : ease_in_quad(t);

    std::optional<Rgb> from_rgb = from ? color_to_rgb(*from) : std::nullopt;
    std::optional<Rgb> to_rgb = to ? color_to_rgb(*to) : std::nullopt;

    if (!from_rgb || !to_rgb) {
        // No smooth path between palette colours
        return eased < 0.5f ? from : to;
    }

    return Color::rgb(interpolate_channel(from_rgb->r, to_rgb->r, eased),
                      interpolate_channel(from_rgb->g, to_rgb->g, eased),
                      interpolate_channel(from_rgb->b, to_rgb->b, eased));
}

} // namespace termtoast
