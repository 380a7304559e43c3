#include "termtoast/error.hpp"

namespace termtoast {

NotificationError::NotificationError(Kind kind, const std::string& message, const std::string& reason,
                                     size_t actual, size_t limit)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_reason(reason)
    , m_actual(actual)
    , m_limit(limit)
{
}

NotificationError NotificationError::invalid_config(const std::string& reason) {
    return NotificationError(Kind::InvalidConfig, "Invalid notification config: " + reason,
                             reason, 0, 0);
}

NotificationError NotificationError::content_too_large(size_t actual, size_t limit) {
    std::string reason = "content is " + std::to_string(actual) +
                         " bytes, limit is " + std::to_string(limit);
    return NotificationError(Kind::ContentTooLarge, "Notification content too large: " + reason,
                             reason, actual, limit);
}

} // namespace termtoast
