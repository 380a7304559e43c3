#pragma once

#include <cstdlib>

namespace termtoast {

// Gates the manager's per-notification diagnostics on stdout: evictions
// made under DiscardOldest, notifications dropped at the concurrency
// limit, and notifications removed once their exit animation finishes.
//
// Enabled when TERMTOAST_DEBUG starts with 1, y or Y. The variable is read
// on the first call only; later changes to the environment are ignored.
inline bool is_debug_mode() {
    static const bool enabled = [] {
        const char* value = std::getenv("TERMTOAST_DEBUG");
        return value != nullptr && (value[0] == '1' || value[0] == 'y' || value[0] == 'Y');
    }();
    return enabled;
}

} // namespace termtoast
