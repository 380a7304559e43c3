#pragma once

#include "layout.hpp"
#include "toast_types.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace termtoast {

struct StackedNotification {
    uint64_t id = 0;
    Rect rect;

    bool operator==(const StackedNotification& other) const {
        return id == other.id && rect == other.rect;
    }
};

// Lay out the notifications sharing one anchor, newest first.
//
// StateMap maps uint64_t ids to a state type providing:
//   current_phase(), created_at(), exterior_padding(),
//   calculate_content_size(const Rect&) -> std::pair<uint16_t, uint16_t>
//
// Pending and Finished entries take no space. The newest sits at the anchor;
// older ones follow with one blank row between them (upward for bottom
// anchors, downward otherwise). max_concurrent drops the oldest outright, and
// the walk stops at the first rect that would leave the frame.
template <typename StateMap>
std::vector<StackedNotification> calculate_stacking_positions(const StateMap& states,
                                                              Anchor anchor,
                                                              const std::vector<uint64_t>& ids,
                                                              const Rect& frame_area,
                                                              std::optional<size_t> max_concurrent) {
    struct Candidate {
        uint64_t id;
        TimePoint created_at;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(ids.size());
    for (uint64_t id : ids) {
        auto it = states.find(id);
        if (it == states.end()) {
            continue;
        }
        AnimationPhase phase = it->second.current_phase();
        if (phase == AnimationPhase::Pending || phase == AnimationPhase::Finished) {
            continue;
        }
        candidates.push_back({id, it->second.created_at()});
    }

    // Newest first; ids break timestamp ties so the order is stable
    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) {
                  if (a.created_at != b.created_at) {
                      return a.created_at > b.created_at;
                  }
                  return a.id > b.id;
              });

    if (max_concurrent && candidates.size() > *max_concurrent) {
        candidates.resize(*max_concurrent);
    }

    std::vector<StackedNotification> result;
    if (frame_area.is_empty()) {
        return result;
    }

    const Position anchor_pos = calculate_anchor_position(anchor, frame_area);
    const bool upward = is_bottom_anchor(anchor);
    Rect previous;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& state = states.find(candidates[i].id)->second;
        auto [width, height] = state.calculate_content_size(frame_area);
        Rect placed = calculate_rect(anchor, anchor_pos, width, height,
                                     frame_area, state.exterior_padding());

        if (i > 0) {
            int y = upward ? static_cast<int>(previous.y) - 1 - placed.height
                           : static_cast<int>(previous.bottom()) + 1;
            if (y < frame_area.y || y + placed.height > frame_area.bottom()) {
                break;
            }
            placed.y = static_cast<uint16_t>(y);
        }

        result.push_back({candidates[i].id, placed});
        previous = placed;
    }

    return result;
}

} // namespace termtoast
