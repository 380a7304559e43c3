#pragma once

#include "color.hpp"
#include "error.hpp"
#include "toast_types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace termtoast {

class NotificationBuilder;

// Immutable notification configuration. Created through NotificationBuilder,
// then handed to NotificationManager::add().
class Notification {
public:
    // Content larger than this is rejected with ContentTooLarge
    static constexpr size_t MAX_CONTENT_BYTES = 64 * 1024;

    const std::string& content() const { return m_content; }
    const std::optional<std::string>& title() const { return m_title; }
    std::optional<Level> level() const { return m_level; }
    Anchor anchor() const { return m_anchor; }
    Animation animation() const { return m_animation; }
    SlideDirection slide_direction() const { return m_slide_direction; }
    std::optional<Position> custom_entry_position() const { return m_entry_position; }
    std::optional<Position> custom_exit_position() const { return m_exit_position; }
    bool fade_effect() const { return m_fade_effect; }

    std::optional<BorderType> border_type() const { return m_border_type; }
    const std::optional<Style>& block_style() const { return m_block_style; }
    const std::optional<Style>& border_style() const { return m_border_style; }
    const std::optional<Style>& title_style() const { return m_title_style; }

    std::optional<SizeConstraint> max_width() const { return m_max_width; }
    std::optional<SizeConstraint> max_height() const { return m_max_height; }
    Padding padding() const { return m_padding; }
    uint16_t margin() const { return m_margin; }

    Timing slide_in_timing() const { return m_slide_in_timing; }
    Timing dwell_timing() const { return m_dwell_timing; }
    Timing slide_out_timing() const { return m_slide_out_timing; }
    AutoDismiss auto_dismiss() const { return m_auto_dismiss; }

private:
    friend class NotificationBuilder;
    Notification() = default;

    std::string m_content;
    std::optional<std::string> m_title;
    std::optional<Level> m_level = Level::Info;
    Anchor m_anchor = Anchor::BottomRight;
    Animation m_animation = Animation::Slide;
    SlideDirection m_slide_direction = SlideDirection::Default;
    std::optional<Position> m_entry_position;
    std::optional<Position> m_exit_position;
    bool m_fade_effect = false;

    std::optional<BorderType> m_border_type = BorderType::Rounded;
    std::optional<Style> m_block_style;
    std::optional<Style> m_border_style;
    std::optional<Style> m_title_style;

    std::optional<SizeConstraint> m_max_width = SizeConstraint::percentage(0.4f);
    std::optional<SizeConstraint> m_max_height = SizeConstraint::percentage(0.2f);
    Padding m_padding = Padding::horizontal(1);
    uint16_t m_margin = 0;

    Timing m_slide_in_timing;
    Timing m_dwell_timing;
    Timing m_slide_out_timing;
    AutoDismiss m_auto_dismiss;
};

// Fluent builder that validates the configuration in build()
class NotificationBuilder {
public:
    explicit NotificationBuilder(std::string content);

    NotificationBuilder& title(std::string title);
    NotificationBuilder& level(Level level);
    NotificationBuilder& no_level();
    NotificationBuilder& anchor(Anchor anchor);
    NotificationBuilder& animation(Animation animation);
    NotificationBuilder& slide_direction(SlideDirection direction);
    NotificationBuilder& entry_position(Position position);
    NotificationBuilder& exit_position(Position position);
    NotificationBuilder& fade(bool enabled);

    NotificationBuilder& border_type(BorderType border_type);
    NotificationBuilder& no_border();
    NotificationBuilder& block_style(const Style& style);
    NotificationBuilder& border_style(const Style& style);
    NotificationBuilder& title_style(const Style& style);

    NotificationBuilder& max_size(SizeConstraint width, SizeConstraint height);
    NotificationBuilder& padding(Padding padding);
    NotificationBuilder& margin(uint16_t margin);

    // Entry, dwell and exit durations
    NotificationBuilder& timing(Timing slide_in, Timing dwell, Timing slide_out);
    NotificationBuilder& auto_dismiss(AutoDismiss auto_dismiss);

    // Throws NotificationError (InvalidConfig or ContentTooLarge)
    Notification build() const;

private:
    Notification m_notification;
};

} // namespace termtoast
