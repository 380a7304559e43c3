#include "termtoast/notification_manager.hpp"
#include "termtoast/animation_handler.hpp"
#include "termtoast/debug.hpp"
#include "termtoast/stacking.hpp"
#include "termtoast/styles.hpp"
#include "termtoast/text.hpp"
#include "termtoast/toast_config.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace termtoast {

NotificationManager::NotificationManager(IClock* clock)
    : m_clock(clock ? clock : &m_steady_clock)
{
}

NotificationManager::~NotificationManager() = default;

uint64_t NotificationManager::add(Notification notification) {
    const uint64_t id = m_next_id++;
    const Anchor anchor = notification.anchor();

    if (m_max_concurrent) {
        std::vector<uint64_t> in_scope = ids_in_overflow_scope(anchor);
        const size_t limit = *m_max_concurrent;

        if (in_scope.size() >= limit) {
            if (m_overflow == Overflow::DiscardNewest || limit == 0) {
                if (is_debug_mode()) {
                    std::cout << "[termtoast] Limit of " << limit << " reached, dropping notification "
                              << id << std::endl;
                }
                return id;
            }

            // DiscardOldest: make room for the newcomer
            while (in_scope.size() >= limit) {
                uint64_t oldest = oldest_of(in_scope);
                m_states.erase(oldest);
                in_scope.erase(std::find(in_scope.begin(), in_scope.end(), oldest));
                if (is_debug_mode()) {
                    std::cout << "[termtoast] Evicted notification " << oldest
                              << " to make room for " << id << std::endl;
                }
            }
        }
    }

    m_states.emplace(id, NotificationState(id, std::move(notification), m_defaults, m_clock->now()));
    return id;
}

uint64_t NotificationManager::add(const NotificationBuilder& builder) {
    return add(builder.build());
}

bool NotificationManager::remove(uint64_t id) {
    return m_states.erase(id) != 0;
}

void NotificationManager::clear() {
    m_states.clear();
}

void NotificationManager::tick(Duration dt) {
    for (uint64_t id : update_states(m_states, dt)) {
        m_states.erase(id);
        if (is_debug_mode()) {
            std::cout << "[termtoast] Notification " << id << " finished" << std::endl;
        }
    }
}

void NotificationManager::apply_config(const ToastConfig& config) {
    m_max_concurrent = config.max_concurrent();
    m_overflow = config.overflow();
    m_overflow_scope = config.overflow_scope();
    m_defaults = config.defaults();
}

const NotificationState* NotificationManager::get(uint64_t id) const {
    auto it = m_states.find(id);
    return it != m_states.end() ? &it->second : nullptr;
}

std::vector<uint64_t> NotificationManager::ids_in_overflow_scope(Anchor anchor) const {
    std::vector<uint64_t> ids;
    for (const auto& [id, state] : m_states) {
        if (m_overflow_scope == OverflowScope::PerAnchor && state.anchor() != anchor) {
            continue;
        }
        ids.push_back(id);
    }
    return ids;
}

uint64_t NotificationManager::oldest_of(const std::vector<uint64_t>& ids) const {
    return *std::min_element(ids.begin(), ids.end(), [this](uint64_t a, uint64_t b) {
        const NotificationState& sa = m_states.at(a);
        const NotificationState& sb = m_states.at(b);
        if (sa.created_at() != sb.created_at()) {
            return sa.created_at() < sb.created_at();
        }
        return a < b;
    });
}

void NotificationManager::render(IFrame& frame, const Rect& frame_area) {
    if (m_states.empty() || frame_area.is_empty()) {
        return;
    }

    // Group by anchor; Pending entries are kept so the stacker sees them
    std::map<Anchor, std::vector<uint64_t>> groups;
    for (const auto& [id, state] : m_states) {
        groups[state.anchor()].push_back(id);
    }

    for (const auto& [anchor, ids] : groups) {
        auto stacked = calculate_stacking_positions(m_states, anchor, ids, frame_area, m_max_concurrent);
        for (const auto& item : stacked) {
            NotificationState& state = m_states.at(item.id);
            state.set_full_rect(item.rect);
            render_notification(frame, frame_area, state);
        }
    }
}

void NotificationManager::render_notification(IFrame& frame, const Rect& frame_area,
                                              NotificationState& state) {
    const Notification& notification = state.notification();
    const IAnimationHandler& handler = get_animation_handler(notification.animation());

    const Rect rect = handler.calculate_rect(state, frame_area);
    if (rect.is_empty()) {
        return;
    }

    const ResolvedStyles styles = resolve_styles(notification.level(), notification.block_style(),
                                                 notification.border_style(), notification.title_style());

    BoxSpec spec;
    spec.has_border = notification.border_type().has_value();
    spec.border_thickness = border_thickness(notification.border_type());
    if (spec.has_border) {
        spec.border_set = handler.apply_block_effect(border_set_for(*notification.border_type()),
                                                     state, frame_area);
    }
    spec.block_style = styles.block;
    spec.border_style = styles.border;
    spec.title_style = styles.title;
    spec.padding = notification.padding();
    spec.title = title_line(notification);

    // Fade colours apply to Fade and to Slide with the fade flag
    const bool fades = notification.animation() == Animation::Fade ||
                       (notification.animation() == Animation::Slide && notification.fade_effect());
    const IAnimationHandler& colors = fades ? get_animation_handler(Animation::Fade) : handler;
    const AnimationPhase phase = state.current_phase();
    const float progress = state.animation_progress();

    spec.border_style.fg = colors.interpolate_frame_foreground(styles.border.fg, phase, progress);
    if (styles.title.fg) {
        spec.title_style.fg = colors.interpolate_frame_foreground(styles.title.fg, phase, progress);
    }
    spec.content_style.fg = colors.interpolate_content_foreground(styles.block.fg, phase, progress);

    // Wrap against the settled size so text does not reflow mid-animation
    const Rect& full = state.full_rect();
    const int inner_width = static_cast<int>(full.width) - 2 * spec.border_thickness -
                            spec.padding.left - spec.padding.right;
    spec.content_lines = wrap_text(notification.content(),
                                   static_cast<uint16_t>(std::max(inner_width, 1)));

    frame.clear(rect);
    frame.draw_box(rect, spec);
}

} // namespace termtoast
