#pragma once

#include "termtoast/color.hpp"
#include "termtoast/frame.hpp"
#include <imgui.h>
#include <optional>
#include <string>

namespace termtoast {

// IFrame that paints onto an ImGui draw list using a fixed character grid.
// Create one per ImGui frame (draw lists are rebuilt every frame):
//
//   ImGuiFrame frame(ImGui::GetForegroundDrawList(), origin, cell_size, cols, rows);
//   manager.render(frame, frame.area());
class ImGuiFrame : public IFrame {
public:
    ImGuiFrame(ImDrawList* draw_list, ImVec2 origin, ImVec2 cell_size,
               uint16_t columns, uint16_t rows);

    Rect area() const override { return m_area; }
    void clear(const Rect& rect) override;
    void draw_box(const Rect& rect, const BoxSpec& spec) override;

    // Colour used for cells without an explicit background
    void set_background(ImU32 color) { m_background = color; }
    // Colour used for text without an explicit foreground
    void set_foreground(ImU32 color) { m_foreground = color; }

    // Top-left pixel of a cell
    ImVec2 cell_position(int x, int y) const;

    // Terminal colour to ImGui colour; `fallback` for none/Reset
    static ImU32 to_imgui_color(const std::optional<Color>& color, ImU32 fallback);

private:
    void fill_cells(const Rect& rect, ImU32 color);
    void draw_glyph(int x, int y, const std::string& glyph, ImU32 color, const Rect& clip);
    void draw_text(int x, int y, const std::string& text, uint16_t max_width, ImU32 color, const Rect& clip);

    ImDrawList* m_draw_list;
    ImVec2 m_origin;
    ImVec2 m_cell_size;
    Rect m_area;

    ImU32 m_background = IM_COL32(20, 20, 28, 240);
    ImU32 m_foreground = IM_COL32(255, 255, 255, 255);
};

} // namespace termtoast
