#include "termtoast/notification.hpp"
#include <utility>

namespace termtoast {

namespace {

void validate_constraint(const std::optional<SizeConstraint>& constraint, const char* axis) {
    if (!constraint) {
        return;
    }
    if (constraint->kind == SizeConstraint::Kind::Percentage) {
        if (!(constraint->fraction > 0.0f && constraint->fraction <= 1.0f)) {
            throw NotificationError::invalid_config(
                std::string("max ") + axis + " percentage must be in (0, 1]");
        }
    } else if (constraint->cells == 0) {
        throw NotificationError::invalid_config(std::string("max ") + axis + " must be at least 1 cell");
    }
}

} // anonymous namespace

NotificationBuilder::NotificationBuilder(std::string content) {
    m_notification.m_content = std::move(content);
}

NotificationBuilder& NotificationBuilder::title(std::string title) {
    m_notification.m_title = std::move(title);
    return *this;
}

NotificationBuilder& NotificationBuilder::level(Level level) {
    m_notification.m_level = level;
    return *this;
}

NotificationBuilder& NotificationBuilder::no_level() {
    m_notification.m_level.reset();
    return *this;
}

NotificationBuilder& NotificationBuilder::anchor(Anchor anchor) {
    m_notification.m_anchor = anchor;
    return *this;
}

NotificationBuilder& NotificationBuilder::animation(Animation animation) {
    m_notification.m_animation = animation;
    return *this;
}

NotificationBuilder& NotificationBuilder::slide_direction(SlideDirection direction) {
    m_notification.m_slide_direction = direction;
    return *this;
}

NotificationBuilder& NotificationBuilder::entry_position(Position position) {
    m_notification.m_entry_position = position;
    return *this;
}

NotificationBuilder& NotificationBuilder::exit_position(Position position) {
    m_notification.m_exit_position = position;
    return *this;
}

NotificationBuilder& NotificationBuilder::fade(bool enabled) {
    m_notification.m_fade_effect = enabled;
    return *this;
}

NotificationBuilder& NotificationBuilder::border_type(BorderType border_type) {
    m_notification.m_border_type = border_type;
    return *this;
}

NotificationBuilder& NotificationBuilder::no_border() {
    m_notification.m_border_type.reset();
    return *this;
}

NotificationBuilder& NotificationBuilder::block_style(const Style& style) {
    m_notification.m_block_style = style;
    return *this;
}

NotificationBuilder& NotificationBuilder::border_style(const Style& style) {
    m_notification.m_border_style = style;
    return *this;
}

NotificationBuilder& NotificationBuilder::title_style(const Style& style) {
    m_notification.m_title_style = style;
    return *this;
}

NotificationBuilder& NotificationBuilder::max_size(SizeConstraint width, SizeConstraint height) {
    m_notification.m_max_width = width;
    m_notification.m_max_height = height;
    return *this;
}

NotificationBuilder& NotificationBuilder::padding(Padding padding) {
    m_notification.m_padding = padding;
    return *this;
}

NotificationBuilder& NotificationBuilder::margin(uint16_t margin) {
    m_notification.m_margin = margin;
    return *this;
}

NotificationBuilder& NotificationBuilder::timing(Timing slide_in, Timing dwell, Timing slide_out) {
    m_notification.m_slide_in_timing = slide_in;
    m_notification.m_dwell_timing = dwell;
    m_notification.m_slide_out_timing = slide_out;
    return *this;
}

NotificationBuilder& NotificationBuilder::auto_dismiss(AutoDismiss auto_dismiss) {
    m_notification.m_auto_dismiss = auto_dismiss;
    return *this;
}

Notification NotificationBuilder::build() const {
    const Notification& n = m_notification;

    if (n.m_content.size() > Notification::MAX_CONTENT_BYTES) {
        throw NotificationError::content_too_large(n.m_content.size(), Notification::MAX_CONTENT_BYTES);
    }

    if (n.m_content.empty() && (!n.m_title || n.m_title->empty())) {
        throw NotificationError::invalid_config("notification needs content or a title");
    }

    validate_constraint(n.m_max_width, "width");
    validate_constraint(n.m_max_height, "height");

    if (n.m_animation != Animation::Slide) {
        if (n.m_fade_effect) {
            throw NotificationError::invalid_config("fade can only be combined with the Slide animation");
        }
        if (n.m_entry_position || n.m_exit_position) {
            throw NotificationError::invalid_config("entry/exit positions require the Slide animation");
        }
    }

    return n;
}

} // namespace termtoast
