#include "imgui_frame.hpp"
#include "termtoast/text.hpp"

namespace termtoast {

namespace {

// xterm 256-colour palette
Rgb indexed_to_rgb(uint8_t index) {
    if (index < 16) {
        static const Color::Type named[16] = {
            Color::Type::Black, Color::Type::Red, Color::Type::Green, Color::Type::Yellow,
            Color::Type::Blue, Color::Type::Magenta, Color::Type::Cyan, Color::Type::Gray,
            Color::Type::DarkGray, Color::Type::LightRed, Color::Type::LightGreen, Color::Type::LightYellow,
            Color::Type::LightBlue, Color::Type::LightMagenta, Color::Type::LightCyan, Color::Type::White
        };
        return *color_to_rgb(Color(named[index]));
    }
    if (index < 232) {
        static const uint8_t levels[6] = {0, 95, 135, 175, 215, 255};
        int i = index - 16;
        return Rgb{levels[i / 36], levels[(i / 6) % 6], levels[i % 6]};
    }
    uint8_t gray = static_cast<uint8_t>(8 + (index - 232) * 10);
    return Rgb{gray, gray, gray};
}

} // anonymous namespace

ImGuiFrame::ImGuiFrame(ImDrawList* draw_list, ImVec2 origin, ImVec2 cell_size,
                       uint16_t columns, uint16_t rows)
    : m_draw_list(draw_list)
    , m_origin(origin)
    , m_cell_size(cell_size)
    , m_area{0, 0, columns, rows}
{
}

ImVec2 ImGuiFrame::cell_position(int x, int y) const {
    return ImVec2(m_origin.x + static_cast<float>(x) * m_cell_size.x,
                  m_origin.y + static_cast<float>(y) * m_cell_size.y);
}

ImU32 ImGuiFrame::to_imgui_color(const std::optional<Color>& color, ImU32 fallback) {
    if (!color || color->type == Color::Type::Reset) {
        return fallback;
    }
    Rgb rgb = color->type == Color::Type::Indexed
        ? indexed_to_rgb(color->index)
        : *color_to_rgb(*color);
    return IM_COL32(rgb.r, rgb.g, rgb.b, 255);
}

void ImGuiFrame::fill_cells(const Rect& rect, ImU32 color) {
    Rect clipped = rect.intersection(m_area);
    if (clipped.is_empty()) {
        return;
    }
    m_draw_list->AddRectFilled(cell_position(clipped.x, clipped.y),
                               cell_position(clipped.right(), clipped.bottom()),
                               color);
}

void ImGuiFrame::clear(const Rect& rect) {
    fill_cells(rect, m_background);
}

void ImGuiFrame::draw_glyph(int x, int y, const std::string& glyph, ImU32 color, const Rect& clip) {
    if (x < clip.x || y < clip.y || x >= clip.right() || y >= clip.bottom()) {
        return;
    }
    if (glyph.empty() || glyph == " ") {
        return;
    }
    m_draw_list->AddText(cell_position(x, y), color, glyph.data(), glyph.data() + glyph.size());
}

void ImGuiFrame::draw_text(int x, int y, const std::string& text, uint16_t max_width,
                           ImU32 color, const Rect& clip) {
    uint16_t used = 0;
    for (const auto& glyph : split_glyphs(text)) {
        uint16_t w = glyph_width(glyph);
        if (w == 0) {
            continue;
        }
        if (used + w > max_width) {
            break;
        }
        draw_glyph(x + used, y, glyph, color, clip);
        used = static_cast<uint16_t>(used + w);
    }
}

void ImGuiFrame::draw_box(const Rect& rect, const BoxSpec& spec) {
    const Rect clip = rect.intersection(m_area);
    if (clip.is_empty()) {
        return;
    }

    fill_cells(clip, to_imgui_color(spec.block_style.bg, m_background));

    const int left = rect.x;
    const int top = rect.y;
    const int right = static_cast<int>(rect.right()) - 1;
    const int bottom = static_cast<int>(rect.bottom()) - 1;

    int inner_left = left;
    int inner_top = top;
    int inner_right = right;
    int inner_bottom = bottom;

    const ImU32 title_color = to_imgui_color(spec.block_style.patch(spec.title_style).fg, m_foreground);

    if (spec.has_border && rect.width >= 2 && rect.height >= 2) {
        const ImU32 border_color = to_imgui_color(spec.block_style.patch(spec.border_style).fg, m_foreground);
        const BorderSet& set = spec.border_set;

        for (int x = left + 1; x < right; ++x) {
            draw_glyph(x, top, set.horizontal_top, border_color, clip);
            draw_glyph(x, bottom, set.horizontal_bottom, border_color, clip);
        }
        for (int y = top + 1; y < bottom; ++y) {
            draw_glyph(left, y, set.vertical_left, border_color, clip);
            draw_glyph(right, y, set.vertical_right, border_color, clip);
        }
        draw_glyph(left, top, set.top_left, border_color, clip);
        draw_glyph(right, top, set.top_right, border_color, clip);
        draw_glyph(left, bottom, set.bottom_left, border_color, clip);
        draw_glyph(right, bottom, set.bottom_right, border_color, clip);

        if (!spec.title.empty() && rect.width > 2) {
            draw_text(left + 1, top, spec.title, static_cast<uint16_t>(rect.width - 2), title_color, clip);
        }

        inner_left += spec.border_thickness;
        inner_top += spec.border_thickness;
        inner_right -= spec.border_thickness;
        inner_bottom -= spec.border_thickness;
    } else if (!spec.title.empty()) {
        draw_text(left, top, spec.title, rect.width, title_color, clip);
        inner_top += 1;
    }

    inner_left += spec.padding.left;
    inner_right -= spec.padding.right;
    inner_top += spec.padding.top;
    inner_bottom -= spec.padding.bottom;

    if (inner_right < inner_left || inner_bottom < inner_top) {
        return;
    }

    const ImU32 content_color = to_imgui_color(spec.block_style.patch(spec.content_style).fg, m_foreground);
    const uint16_t inner_width = static_cast<uint16_t>(inner_right - inner_left + 1);
    int y = inner_top;
    for (const auto& line : spec.content_lines) {
        if (y > inner_bottom) {
            break;
        }
        draw_text(inner_left, y, line, inner_width, content_color, clip);
        ++y;
    }
}

} // namespace termtoast
