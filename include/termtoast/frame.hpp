#pragma once

#include "color.hpp"
#include "toast_types.hpp"
#include <string>
#include <vector>

namespace termtoast {

// The eight glyphs that make up a box border
struct BorderSet {
    std::string top_left;
    std::string top_right;
    std::string bottom_left;
    std::string bottom_right;
    std::string vertical_left;
    std::string vertical_right;
    std::string horizontal_top;
    std::string horizontal_bottom;

    bool operator==(const BorderSet& other) const {
        return top_left == other.top_left && top_right == other.top_right &&
               bottom_left == other.bottom_left && bottom_right == other.bottom_right &&
               vertical_left == other.vertical_left && vertical_right == other.vertical_right &&
               horizontal_top == other.horizontal_top && horizontal_bottom == other.horizontal_bottom;
    }
    bool operator!=(const BorderSet& other) const { return !(*this == other); }
};

BorderSet border_set_for(BorderType border_type);

// Cells taken by the border on each side (0 when there is no border)
uint16_t border_thickness(const std::optional<BorderType>& border_type);

// Everything needed to draw one notification box
struct BoxSpec {
    bool has_border = true;
    BorderSet border_set;
    uint16_t border_thickness = 1;
    Style block_style;
    Style border_style;
    Style title_style;
    Style content_style;
    std::string title;                      // Empty for no title
    std::vector<std::string> content_lines; // Already wrapped to the inner width
    Padding padding;
};

// Terminal rendering collaborator: the core computes rects, colours and text,
// the frame owns glyph output.
class IFrame {
public:
    virtual ~IFrame() = default;

    // Current drawable area
    virtual Rect area() const = 0;

    // Erase whatever lies underneath an overlay
    virtual void clear(const Rect& rect) = 0;

    // Draw a bordered box with title and content, clipped to `rect`
    virtual void draw_box(const Rect& rect, const BoxSpec& spec) = 0;
};

} // namespace termtoast
