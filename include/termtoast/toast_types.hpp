#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace termtoast {

using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;

// Terminal cell rectangle
struct Rect {
    uint16_t x = 0;
    uint16_t y = 0;
    uint16_t width = 0;
    uint16_t height = 0;

    uint16_t right() const { return static_cast<uint16_t>(x + width); }
    uint16_t bottom() const { return static_cast<uint16_t>(y + height); }
    uint32_t area() const { return static_cast<uint32_t>(width) * height; }
    bool is_empty() const { return width == 0 || height == 0; }

    // Overlapping part of both rects; a default Rect when they do not overlap
    Rect intersection(const Rect& other) const {
        int x1 = std::max<int>(x, other.x);
        int y1 = std::max<int>(y, other.y);
        int x2 = std::min<int>(right(), other.right());
        int y2 = std::min<int>(bottom(), other.bottom());
        if (x2 <= x1 || y2 <= y1) {
            return Rect{};
        }
        return Rect{static_cast<uint16_t>(x1), static_cast<uint16_t>(y1),
                    static_cast<uint16_t>(x2 - x1), static_cast<uint16_t>(y2 - y1)};
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

struct Position {
    uint16_t x = 0;
    uint16_t y = 0;

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// Sub-cell position used while animating (may lie outside the frame)
struct PointF {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const PointF& other) const { return x == other.x && y == other.y; }
};

struct Padding {
    uint16_t left = 0;
    uint16_t right = 0;
    uint16_t top = 0;
    uint16_t bottom = 0;

    static Padding uniform(uint16_t n) { return Padding{n, n, n, n}; }
    static Padding horizontal(uint16_t n) { return Padding{n, n, 0, 0}; }
    static Padding symmetric(uint16_t h, uint16_t v) { return Padding{h, h, v, v}; }

    bool operator==(const Padding& other) const {
        return left == other.left && right == other.right &&
               top == other.top && bottom == other.bottom;
    }
    bool operator!=(const Padding& other) const { return !(*this == other); }
};

// Reference point of a notification within the frame (3x3 grid)
enum class Anchor : uint8_t {
    TopLeft,
    TopCenter,
    TopRight,
    MiddleLeft,
    MiddleCenter,
    MiddleRight,
    BottomLeft,
    BottomCenter,
    BottomRight
};

// Entry/exit animation style
enum class Animation : uint8_t {
    Slide,
    ExpandCollapse,
    Fade
};

// Lifecycle stage of a notification
enum class AnimationPhase : uint8_t {
    Pending,
    SlidingIn,
    Expanding,
    FadingIn,
    Dwelling,
    SlidingOut,
    Collapsing,
    FadingOut,
    Finished
};

// Severity - affects default border colour and title icon
enum class Level : uint8_t {
    Info,
    Warn,
    Error,
    Debug,
    Trace
};

// Which notification goes when the concurrency limit is exceeded
enum class Overflow : uint8_t {
    DiscardOldest,
    DiscardNewest
};

// Which live notifications count against the concurrency limit
enum class OverflowScope : uint8_t {
    Global,
    PerAnchor
};

enum class SlideDirection : uint8_t {
    Default,        // Resolved from the anchor
    FromTop,
    FromBottom,
    FromLeft,
    FromRight,
    FromTopLeft,
    FromTopRight,
    FromBottomLeft,
    FromBottomRight
};

enum class BorderType : uint8_t {
    Plain,
    Rounded,
    Double,
    Thick
};

// Maximum size along one axis: absolute cells or a fraction of the frame
struct SizeConstraint {
    enum class Kind : uint8_t { Absolute, Percentage };

    Kind kind = Kind::Absolute;
    uint16_t cells = 0;
    float fraction = 0.0f;

    static SizeConstraint absolute(uint16_t cells) { return SizeConstraint{Kind::Absolute, cells, 0.0f}; }
    static SizeConstraint percentage(float fraction) { return SizeConstraint{Kind::Percentage, 0, fraction}; }

    // Resolve against the frame dimension on the same axis
    uint16_t resolve(uint16_t available) const {
        if (kind == Kind::Absolute) {
            return cells;
        }
        return static_cast<uint16_t>(static_cast<float>(available) * fraction);
    }

    bool operator==(const SizeConstraint& other) const {
        return kind == other.kind && cells == other.cells && fraction == other.fraction;
    }
};

// Animation phase duration: fixed, or resolved from ManagerDefaults
struct Timing {
    enum class Kind : uint8_t { Auto, Fixed };

    Kind kind = Kind::Auto;
    Duration duration{0};

    static Timing automatic() { return Timing{}; }
    static Timing fixed(Duration d) { return Timing{Kind::Fixed, d}; }

    bool is_fixed() const { return kind == Kind::Fixed; }

    bool operator==(const Timing& other) const {
        return kind == other.kind && (kind == Kind::Auto || duration == other.duration);
    }
};

struct AutoDismiss {
    enum class Kind : uint8_t { After, Never };

    Kind kind = Kind::After;
    Duration duration{4000};

    static AutoDismiss after(Duration d) { return AutoDismiss{Kind::After, d}; }
    static AutoDismiss never() { return AutoDismiss{Kind::Never, Duration{0}}; }

    bool is_never() const { return kind == Kind::Never; }

    bool operator==(const AutoDismiss& other) const {
        return kind == other.kind && (kind == Kind::Never || duration == other.duration);
    }
};

// String conversion (used by the configuration layer and diagnostics)
const char* to_string(Anchor anchor);
const char* to_string(Animation animation);
const char* to_string(AnimationPhase phase);
const char* to_string(Level level);
const char* to_string(Overflow overflow);
const char* to_string(OverflowScope scope);
const char* to_string(SlideDirection direction);
const char* to_string(BorderType border_type);

std::optional<Anchor> anchor_from_string(const std::string& s);
std::optional<Animation> animation_from_string(const std::string& s);
std::optional<Level> level_from_string(const std::string& s);
std::optional<Overflow> overflow_from_string(const std::string& s);
std::optional<OverflowScope> overflow_scope_from_string(const std::string& s);
std::optional<SlideDirection> slide_direction_from_string(const std::string& s);
std::optional<BorderType> border_type_from_string(const std::string& s);

} // namespace termtoast
