#include "termtoast/buffer_frame.hpp"
#include "termtoast/text.hpp"

namespace termtoast {

BufferFrame::BufferFrame(uint16_t width, uint16_t height)
    : m_area{0, 0, width, height}
    , m_cells(static_cast<size_t>(width) * height)
{
}

void BufferFrame::reset() {
    for (auto& cell : m_cells) {
        cell = Cell{};
    }
}

const Cell& BufferFrame::cell(uint16_t x, uint16_t y) const {
    if (x >= m_area.width || y >= m_area.height) {
        return m_blank;
    }
    return m_cells[static_cast<size_t>(y) * m_area.width + x];
}

std::string BufferFrame::row_text(uint16_t y) const {
    std::string text;
    if (y >= m_area.height) {
        return text;
    }
    for (uint16_t x = 0; x < m_area.width; ++x) {
        text += m_cells[static_cast<size_t>(y) * m_area.width + x].symbol;
    }
    return text;
}

void BufferFrame::clear(const Rect& rect) {
    Rect clipped = rect.intersection(m_area);
    for (uint16_t y = clipped.y; y < clipped.bottom(); ++y) {
        for (uint16_t x = clipped.x; x < clipped.right(); ++x) {
            m_cells[static_cast<size_t>(y) * m_area.width + x] = Cell{};
        }
    }
}

void BufferFrame::set_symbol(int x, int y, const std::string& symbol, const Style& style, const Rect& clip) {
    if (x < clip.x || y < clip.y || x >= clip.right() || y >= clip.bottom()) {
        return;
    }
    Cell& target = m_cells[static_cast<size_t>(y) * m_area.width + x];
    target.symbol = symbol;
    target.style = style;
}

uint16_t BufferFrame::put_string(int x, int y, const std::string& text, uint16_t max_width,
                                 const Style& style, const Rect& clip) {
    uint16_t used = 0;
    for (const auto& glyph : split_glyphs(text)) {
        uint16_t w = glyph_width(glyph);
        if (w == 0) {
            continue;
        }
        if (used + w > max_width) {
            break;
        }
        set_symbol(x + used, y, glyph, style, clip);
        if (w == 2) {
            set_symbol(x + used + 1, y, "", style, clip);
        }
        used = static_cast<uint16_t>(used + w);
    }
    return used;
}

void BufferFrame::draw_box(const Rect& rect, const BoxSpec& spec) {
    const Rect clip = rect.intersection(m_area);
    if (clip.is_empty()) {
        return;
    }

    // Background
    for (uint16_t y = clip.y; y < clip.bottom(); ++y) {
        for (uint16_t x = clip.x; x < clip.right(); ++x) {
            set_symbol(x, y, " ", spec.block_style, clip);
        }
    }

    const int left = rect.x;
    const int top = rect.y;
    const int right = static_cast<int>(rect.right()) - 1;
    const int bottom = static_cast<int>(rect.bottom()) - 1;

    int inner_left = left;
    int inner_top = top;
    int inner_right = right;
    int inner_bottom = bottom;

    const Style title_style = spec.block_style.patch(spec.title_style);

    if (spec.has_border && rect.width >= 2 && rect.height >= 2) {
        const Style border_style = spec.block_style.patch(spec.border_style);
        const BorderSet& set = spec.border_set;

        for (int x = left + 1; x < right; ++x) {
            set_symbol(x, top, set.horizontal_top, border_style, clip);
            set_symbol(x, bottom, set.horizontal_bottom, border_style, clip);
        }
        for (int y = top + 1; y < bottom; ++y) {
            set_symbol(left, y, set.vertical_left, border_style, clip);
            set_symbol(right, y, set.vertical_right, border_style, clip);
        }
        set_symbol(left, top, set.top_left, border_style, clip);
        set_symbol(right, top, set.top_right, border_style, clip);
        set_symbol(left, bottom, set.bottom_left, border_style, clip);
        set_symbol(right, bottom, set.bottom_right, border_style, clip);

        if (!spec.title.empty() && rect.width > 2) {
            put_string(left + 1, top, spec.title, static_cast<uint16_t>(rect.width - 2), title_style, clip);
        }

        inner_left += spec.border_thickness;
        inner_top += spec.border_thickness;
        inner_right -= spec.border_thickness;
        inner_bottom -= spec.border_thickness;
    } else if (!spec.title.empty()) {
        put_string(left, top, spec.title, rect.width, title_style, clip);
        inner_top += 1;
    }

    inner_left += spec.padding.left;
    inner_right -= spec.padding.right;
    inner_top += spec.padding.top;
    inner_bottom -= spec.padding.bottom;

    if (inner_right < inner_left || inner_bottom < inner_top) {
        return;
    }

    const Style content_style = spec.block_style.patch(spec.content_style);
    const uint16_t inner_width = static_cast<uint16_t>(inner_right - inner_left + 1);
    int y = inner_top;
    for (const auto& line : spec.content_lines) {
        if (y > inner_bottom) {
            break;
        }
        put_string(inner_left, y, line, inner_width, content_style, clip);
        ++y;
    }
}

} // namespace termtoast
