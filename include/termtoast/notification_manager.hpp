#pragma once

#include "clock.hpp"
#include "frame.hpp"
#include "notification.hpp"
#include "notification_state.hpp"
#include "toast_types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace termtoast {

class ToastConfig;

// Owns all live notifications (toast messages) and drives them once per UI frame:
//   manager.tick(elapsed);
//   manager.render(frame, frame.area());
// Single-threaded; call from the host's render loop.
class NotificationManager {
public:
    // clock is not owned; nullptr uses an internal steady clock
    explicit NotificationManager(IClock* clock = nullptr);
    ~NotificationManager();

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    // Take ownership of a notification. Always returns a fresh id, even when
    // DiscardNewest drops the notification straight away.
    uint64_t add(Notification notification);

    // Build then add. Throws NotificationError if the builder is invalid.
    uint64_t add(const NotificationBuilder& builder);

    bool remove(uint64_t id);
    void clear();

    // Advance every notification by dt and drop the finished ones
    void tick(Duration dt);

    // Draw all visible notifications into frame_area
    void render(IFrame& frame, const Rect& frame_area);

    void set_max_concurrent(std::optional<size_t> max) { m_max_concurrent = max; }
    std::optional<size_t> max_concurrent() const { return m_max_concurrent; }

    void set_overflow(Overflow overflow) { m_overflow = overflow; }
    Overflow overflow() const { return m_overflow; }

    void set_overflow_scope(OverflowScope scope) { m_overflow_scope = scope; }
    OverflowScope overflow_scope() const { return m_overflow_scope; }

    // Applies to notifications added afterwards
    void set_defaults(const ManagerDefaults& defaults) { m_defaults = defaults; }
    const ManagerDefaults& defaults() const { return m_defaults; }

    void apply_config(const ToastConfig& config);

    size_t count() const { return m_states.size(); }
    bool contains(uint64_t id) const { return m_states.count(id) != 0; }

    // Read-only view of a live notification, nullptr if unknown
    const NotificationState* get(uint64_t id) const;

private:
    // Live ids that count against max_concurrent for a newcomer at `anchor`
    std::vector<uint64_t> ids_in_overflow_scope(Anchor anchor) const;

    // Oldest by (created_at, id); ids must not be empty
    uint64_t oldest_of(const std::vector<uint64_t>& ids) const;

    void render_notification(IFrame& frame, const Rect& frame_area, NotificationState& state);

    std::map<uint64_t, NotificationState> m_states;
    uint64_t m_next_id = 0;

    std::optional<size_t> m_max_concurrent;
    Overflow m_overflow = Overflow::DiscardOldest;
    OverflowScope m_overflow_scope = OverflowScope::Global;
    ManagerDefaults m_defaults;

    SteadyClock m_steady_clock;
    IClock* m_clock;
};

} // namespace termtoast
