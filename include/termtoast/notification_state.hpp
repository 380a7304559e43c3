#pragma once

#include "notification.hpp"
#include "toast_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace termtoast {

// Durations used when a notification's timing is Timing::Auto
struct ManagerDefaults {
    Duration slide_duration{300};
    Duration expand_collapse_duration{250};
    Duration fade_duration{400};

    // Entry/exit phase length for an animation kind
    Duration animation_duration(Animation animation) const;
};

AnimationPhase entry_phase_for(Animation animation);
AnimationPhase exit_phase_for(Animation animation);

// Mutable runtime state of one live notification.
//
// Lifecycle:
//   Pending -> SlidingIn | Expanding | FadingIn -> Dwelling
//           -> SlidingOut | Collapsing | FadingOut -> Finished
//
// Progress runs 0..1 through each entry/exit phase. Dwelling is governed by
// the remaining display time instead (absent = stay until removed).
class NotificationState {
public:
    NotificationState(uint64_t id, Notification notification,
                      const ManagerDefaults& defaults, TimePoint created_at);
    NotificationState(uint64_t id, Notification notification,
                      const ManagerDefaults& defaults);

    // Advance the state machine by dt
    void update(Duration dt);

    uint64_t id() const { return m_id; }
    const Notification& notification() const { return m_notification; }
    Anchor anchor() const { return m_notification.anchor(); }
    AnimationPhase current_phase() const { return m_phase; }
    float animation_progress() const { return m_progress; }
    std::optional<Duration> remaining_display_time() const { return m_remaining_display_time; }
    TimePoint created_at() const { return m_created_at; }

    bool is_finished() const { return m_phase == AnimationPhase::Finished; }

    // On-screen target rect once fully shown; refreshed on every render
    const Rect& full_rect() const { return m_full_rect; }
    void set_full_rect(const Rect& rect) { m_full_rect = rect; }

    std::optional<PointF> custom_entry_position() const { return m_custom_entry_position; }
    std::optional<PointF> custom_exit_position() const { return m_custom_exit_position; }

    uint16_t exterior_padding() const { return m_notification.margin(); }

    // Natural size against the current frame (percentage constraints are frame-relative)
    std::pair<uint16_t, uint16_t> calculate_content_size(const Rect& frame_area) const;

    Duration entry_duration() const { return m_entry_duration; }
    Duration exit_duration() const { return m_exit_duration; }
    std::optional<Duration> dwell_duration() const { return m_dwell_duration; }

private:
    void advance_progress(Duration dt, Duration phase_duration);
    void enter_dwelling();

    uint64_t m_id;
    Notification m_notification;
    AnimationPhase m_phase = AnimationPhase::Pending;
    float m_progress = 0.0f;
    std::optional<Duration> m_remaining_display_time;
    TimePoint m_created_at;
    Rect m_full_rect;

    std::optional<PointF> m_custom_entry_position;
    std::optional<PointF> m_custom_exit_position;

    Duration m_entry_duration;
    Duration m_exit_duration;
    std::optional<Duration> m_dwell_duration;
};

// Advance every state by the same dt. Returns the IDs (ascending) that
// reached Finished during this call.
std::vector<uint64_t> update_states(std::map<uint64_t, NotificationState>& states, Duration dt);

} // namespace termtoast
