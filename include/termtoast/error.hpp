#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace termtoast {

// Raised by NotificationBuilder::build() when a configuration cannot be used
class NotificationError : public std::runtime_error {
public:
    enum class Kind {
        InvalidConfig,
        ContentTooLarge
    };

    static NotificationError invalid_config(const std::string& reason);
    static NotificationError content_too_large(size_t actual, size_t limit);

    Kind kind() const { return m_kind; }
    const std::string& reason() const { return m_reason; }

    // Byte counts; only meaningful for ContentTooLarge
    size_t actual() const { return m_actual; }
    size_t limit() const { return m_limit; }

private:
    NotificationError(Kind kind, const std::string& message, const std::string& reason,
                      size_t actual, size_t limit);

    Kind m_kind;
    std::string m_reason;
    size_t m_actual = 0;
    size_t m_limit = 0;
};

} // namespace termtoast
