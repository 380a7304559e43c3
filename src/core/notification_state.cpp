#include "termtoast/notification_state.hpp"
#include "termtoast/size_calculator.hpp"
#include <algorithm>
#include <utility>

namespace termtoast {

namespace {

Duration resolve_timing(const Timing& timing, Duration automatic) {
    return timing.is_fixed() ? timing.duration : automatic;
}

std::optional<PointF> to_point(const std::optional<Position>& position) {
    if (!position) {
        return std::nullopt;
    }
    return PointF{static_cast<float>(position->x), static_cast<float>(position->y)};
}

bool is_entry_phase(AnimationPhase phase) {
    return phase == AnimationPhase::SlidingIn ||
           phase == AnimationPhase::Expanding ||
           phase == AnimationPhase::FadingIn;
}

bool is_exit_phase(AnimationPhase phase) {
    return phase == AnimationPhase::SlidingOut ||
           phase == AnimationPhase::Collapsing ||
           phase == AnimationPhase::FadingOut;
}

} // anonymous namespace

Duration ManagerDefaults::animation_duration(Animation animation) const {
    switch (animation) {
        case Animation::Slide: return slide_duration;
        case Animation::ExpandCollapse: return expand_collapse_duration;
        case Animation::Fade: return fade_duration;
    }
    return slide_duration;
}

AnimationPhase entry_phase_for(Animation animation) {
    switch (animation) {
        case Animation::Slide: return AnimationPhase::SlidingIn;
        case Animation::ExpandCollapse: return AnimationPhase::Expanding;
        case Animation::Fade: return AnimationPhase::FadingIn;
    }
    return AnimationPhase::SlidingIn;
}

AnimationPhase exit_phase_for(Animation animation) {
    switch (animation) {
        case Animation::Slide: return AnimationPhase::SlidingOut;
        case Animation::ExpandCollapse: return AnimationPhase::Collapsing;
        case Animation::Fade: return AnimationPhase::FadingOut;
    }
    return AnimationPhase::SlidingOut;
}

NotificationState::NotificationState(uint64_t id, Notification notification,
                                     const ManagerDefaults& defaults, TimePoint created_at)
    : m_id(id)
    , m_notification(std::move(notification))
    , m_created_at(created_at)
{
    // Positions are copied now; the renderer only looks at the state's copies
    m_custom_entry_position = to_point(m_notification.custom_entry_position());
    m_custom_exit_position = to_point(m_notification.custom_exit_position());

    const Duration automatic = defaults.animation_duration(m_notification.animation());
    m_entry_duration = resolve_timing(m_notification.slide_in_timing(), automatic);
    m_exit_duration = resolve_timing(m_notification.slide_out_timing(), automatic);

    const AutoDismiss dismiss = m_notification.auto_dismiss();
    if (!dismiss.is_never()) {
        m_dwell_duration = m_notification.dwell_timing().is_fixed()
            ? m_notification.dwell_timing().duration
            : dismiss.duration;
    }
}

NotificationState::NotificationState(uint64_t id, Notification notification,
                                     const ManagerDefaults& defaults)
    : NotificationState(id, std::move(notification), defaults, std::chrono::steady_clock::now())
{
}

void NotificationState::advance_progress(Duration dt, Duration phase_duration) {
    if (phase_duration.count() <= 0) {
        m_progress = 1.0f;
        return;
    }
    const float step = static_cast<float>(dt.count()) / static_cast<float>(phase_duration.count());
    m_progress = std::clamp(m_progress + std::max(step, 0.0f), 0.0f, 1.0f);
}

void NotificationState::enter_dwelling() {
    m_phase = AnimationPhase::Dwelling;
    m_progress = 1.0f;
    m_remaining_display_time = m_dwell_duration;
    if (m_remaining_display_time) {
        m_remaining_display_time = std::max(*m_remaining_display_time, Duration::zero());
    }
}

void NotificationState::update(Duration dt) {
    if (m_phase == AnimationPhase::Pending) {
        m_phase = entry_phase_for(m_notification.animation());
        m_progress = 0.0f;
    }

    if (is_entry_phase(m_phase)) {
        advance_progress(dt, m_entry_duration);
        if (m_progress >= 1.0f) {
            enter_dwelling();
        }
        return;
    }

    if (m_phase == AnimationPhase::Dwelling) {
        if (!m_remaining_display_time) {
            return;
        }
        Duration remaining = *m_remaining_display_time - std::max(dt, Duration::zero());
        m_remaining_display_time = std::max(remaining, Duration::zero());
        if (m_remaining_display_time->count() == 0) {
            m_phase = exit_phase_for(m_notification.animation());
            m_progress = 0.0f;
        }
        return;
    }

    if (is_exit_phase(m_phase)) {
        advance_progress(dt, m_exit_duration);
        if (m_progress >= 1.0f) {
            m_progress = 1.0f;
            m_phase = AnimationPhase::Finished;
        }
    }
}

std::pair<uint16_t, uint16_t> NotificationState::calculate_content_size(const Rect& frame_area) const {
    return calculate_size(m_notification, frame_area);
}

std::vector<uint64_t> update_states(std::map<uint64_t, NotificationState>& states, Duration dt) {
    std::vector<uint64_t> finished;
    for (auto& [id, state] : states) {
        if (state.is_finished()) {
            continue;
        }
        state.update(dt);
        if (state.is_finished()) {
            finished.push_back(id);
        }
    }
    return finished;
}

} // namespace termtoast
