#pragma once

#include "toast_types.hpp"

namespace termtoast {

// Concrete cell position of an anchor within the frame.
// Left/Top use the frame origin, Center/Middle the midpoint (integer division),
// Right/Bottom the last column/row.
Position calculate_anchor_position(Anchor anchor, const Rect& frame);

// Replace SlideDirection::Default with the direction matching the anchor.
// Explicit directions are returned unchanged.
SlideDirection resolve_slide_direction(SlideDirection direction, Anchor anchor);

// Position just outside the frame from which a notification slides in (or to
// which it slides out): one cell beyond the edge, the full rect size further
// for the left/top edges. Diagonals move on both axes; Default returns the
// full rect's own position, so resolve the direction first.
PointF slide_offscreen_position(SlideDirection direction,
                                const Rect& full_rect, const Rect& frame_area);

// Place a rect of the given size at an anchor position. The margin
// (exterior_padding) pushes the rect inward from the edge the anchor touches
// and is ignored on a centred axis. The result always lies inside the frame.
Rect calculate_rect(Anchor anchor, const Position& anchor_pos,
                    uint16_t width, uint16_t height,
                    const Rect& frame, uint16_t exterior_padding);

// Anchor classification helpers
bool is_top_anchor(Anchor anchor);
bool is_bottom_anchor(Anchor anchor);

} // namespace termtoast
