#pragma once

#include "color.hpp"
#include "frame.hpp"
#include "toast_types.hpp"
#include <string>
#include <vector>

namespace termtoast {

// One terminal cell. Wide glyphs occupy their first cell; the follow-up
// cell holds an empty symbol.
struct Cell {
    std::string symbol = " ";
    Style style;
};

// Headless IFrame backed by an in-memory cell grid
class BufferFrame : public IFrame {
public:
    BufferFrame(uint16_t width, uint16_t height);

    Rect area() const override { return m_area; }
    void clear(const Rect& rect) override;
    void draw_box(const Rect& rect, const BoxSpec& spec) override;

    // Out-of-range coordinates return a blank cell
    const Cell& cell(uint16_t x, uint16_t y) const;

    // Symbols of one row joined together
    std::string row_text(uint16_t y) const;

    // Reset every cell to blank
    void reset();

private:
    void set_symbol(int x, int y, const std::string& symbol, const Style& style, const Rect& clip);
    // Returns the number of cells written
    uint16_t put_string(int x, int y, const std::string& text, uint16_t max_width,
                        const Style& style, const Rect& clip);

    Rect m_area;
    std::vector<Cell> m_cells;
    Cell m_blank;
};

} // namespace termtoast
