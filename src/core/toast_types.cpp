#include "termtoast/toast_types.hpp"

namespace termtoast {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> parse_enum(const std::string& s, const Enum (&values)[N]) {
    for (Enum value : values) {
        if (s == to_string(value)) {
            return value;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

const char* to_string(Anchor anchor) {
    switch (anchor) {
        case Anchor::TopLeft: return "TopLeft";
        case Anchor::TopCenter: return "TopCenter";
        case Anchor::TopRight: return "TopRight";
        case Anchor::MiddleLeft: return "MiddleLeft";
        case Anchor::MiddleCenter: return "MiddleCenter";
        case Anchor::MiddleRight: return "MiddleRight";
        case Anchor::BottomLeft: return "BottomLeft";
        case Anchor::BottomCenter: return "BottomCenter";
        case Anchor::BottomRight: return "BottomRight";
    }
    return "Unknown";
}

const char* to_string(Animation animation) {
    switch (animation) {
        case Animation::Slide: return "Slide";
        case Animation::ExpandCollapse: return "ExpandCollapse";
        case Animation::Fade: return "Fade";
    }
    return "Unknown";
}

const char* to_string(AnimationPhase phase) {
    switch (phase) {
        case AnimationPhase::Pending: return "Pending";
        case AnimationPhase::SlidingIn: return "SlidingIn";
        case AnimationPhase::Expanding: return "Expanding";
        case AnimationPhase::FadingIn: return "FadingIn";
        case AnimationPhase::Dwelling: return "Dwelling";
        case AnimationPhase::SlidingOut: return "SlidingOut";
        case AnimationPhase::Collapsing: return "Collapsing";
        case AnimationPhase::FadingOut: return "FadingOut";
        case AnimationPhase::Finished: return "Finished";
    }
    return "Unknown";
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Info: return "Info";
        case Level::Warn: return "Warn";
        case Level::Error: return "Error";
        case Level::Debug: return "Debug";
        case Level::Trace: return "Trace";
    }
    return "Unknown";
}

const char* to_string(Overflow overflow) {
    switch (overflow) {
        case Overflow::DiscardOldest: return "DiscardOldest";
        case Overflow::DiscardNewest: return "DiscardNewest";
    }
    return "Unknown";
}

const char* to_string(OverflowScope scope) {
    switch (scope) {
        case OverflowScope::Global: return "Global";
        case OverflowScope::PerAnchor: return "PerAnchor";
    }
    return "Unknown";
}

const char* to_string(SlideDirection direction) {
    switch (direction) {
        case SlideDirection::Default: return "Default";
        case SlideDirection::FromTop: return "FromTop";
        case SlideDirection::FromBottom: return "FromBottom";
        case SlideDirection::FromLeft: return "FromLeft";
        case SlideDirection::FromRight: return "FromRight";
        case SlideDirection::FromTopLeft: return "FromTopLeft";
        case SlideDirection::FromTopRight: return "FromTopRight";
        case SlideDirection::FromBottomLeft: return "FromBottomLeft";
        case SlideDirection::FromBottomRight: return "FromBottomRight";
    }
    return "Unknown";
}

const char* to_string(BorderType border_type) {
    switch (border_type) {
        case BorderType::Plain: return "Plain";
        case BorderType::Rounded: return "Rounded";
        case BorderType::Double: return "Double";
        case BorderType::Thick: return "Thick";
    }
    return "Unknown";
}

std::optional<Anchor> anchor_from_string(const std::string& s) {
    static const Anchor values[] = {
        Anchor::TopLeft, Anchor::TopCenter, Anchor::TopRight,
        Anchor::MiddleLeft, Anchor::MiddleCenter, Anchor::MiddleRight,
        Anchor::BottomLeft, Anchor::BottomCenter, Anchor::BottomRight
    };
    return parse_enum(s, values);
}

std::optional<Animation> animation_from_string(const std::string& s) {
    static const Animation values[] = {
        Animation::Slide, Animation::ExpandCollapse, Animation::Fade
    };
    return parse_enum(s, values);
}

std::optional<Level> level_from_string(const std::string& s) {
    static const Level values[] = {
        Level::Info, Level::Warn, Level::Error, Level::Debug, Level::Trace
    };
    return parse_enum(s, values);
}

std::optional<Overflow> overflow_from_string(const std::string& s) {
    static const Overflow values[] = { Overflow::DiscardOldest, Overflow::DiscardNewest };
    return parse_enum(s, values);
}

std::optional<OverflowScope> overflow_scope_from_string(const std::string& s) {
    static const OverflowScope values[] = { OverflowScope::Global, OverflowScope::PerAnchor };
    return parse_enum(s, values);
}

std::optional<SlideDirection> slide_direction_from_string(const std::string& s) {
    static const SlideDirection values[] = {
        SlideDirection::Default,
        SlideDirection::FromTop, SlideDirection::FromBottom,
        SlideDirection::FromLeft, SlideDirection::FromRight,
        SlideDirection::FromTopLeft, SlideDirection::FromTopRight,
        SlideDirection::FromBottomLeft, SlideDirection::FromBottomRight
    };
    return parse_enum(s, values);
}

std::optional<BorderType> border_type_from_string(const std::string& s) {
    static const BorderType values[] = {
        BorderType::Plain, BorderType::Rounded, BorderType::Double, BorderType::Thick
    };
    return parse_enum(s, values);
}

} // namespace termtoast
