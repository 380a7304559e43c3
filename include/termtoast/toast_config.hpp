#pragma once

#include "notification_state.hpp"
#include "toast_types.hpp"
#include <filesystem>
#include <optional>

namespace termtoast {

// Manager-wide settings persisted as JSON:
//
//   {
//     "max_concurrent": 5,            (null = unlimited)
//     "overflow": "DiscardOldest",
//     "overflow_scope": "Global",
//     "durations_ms": { "slide": 300, "expand_collapse": 250, "fade": 400 }
//   }
class ToastConfig {
public:
    ToastConfig() = default;

    // A missing file keeps the current values and still succeeds.
    // Malformed content is reported and leaves the current values intact.
    bool load(const std::filesystem::path& config_path);
    bool save(const std::filesystem::path& config_path) const;

    std::optional<size_t> max_concurrent() const { return m_max_concurrent; }
    void set_max_concurrent(std::optional<size_t> max) { m_max_concurrent = max; m_modified = true; }

    Overflow overflow() const { return m_overflow; }
    void set_overflow(Overflow overflow) { m_overflow = overflow; m_modified = true; }

    OverflowScope overflow_scope() const { return m_overflow_scope; }
    void set_overflow_scope(OverflowScope scope) { m_overflow_scope = scope; m_modified = true; }

    const ManagerDefaults& defaults() const { return m_defaults; }
    void set_defaults(const ManagerDefaults& defaults) { m_defaults = defaults; m_modified = true; }

    void reset_to_defaults();

    bool is_modified() const { return m_modified; }
    void clear_modified() { m_modified = false; }

private:
    std::optional<size_t> m_max_concurrent;
    Overflow m_overflow = Overflow::DiscardOldest;
    OverflowScope m_overflow_scope = OverflowScope::Global;
    ManagerDefaults m_defaults;

    bool m_modified = false;
};

} // namespace termtoast
