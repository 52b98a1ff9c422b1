#pragma once
/*
 * CellBuffer
 *
 * Purpose: width x height grid of styled cells that widgets paint into.
 * Note: writes outside the grid are dropped, so drawing code may overrun freely.
 */
#include <cstdint>
#include <string>
#include <vector>
#include "style.hpp"
#include "text.hpp"
#include "types.hpp"

struct Cell {
  uint32_t codepoint = ' ';
  Style style;
  bool operator==(const Cell&) const = default;
};

class CellBuffer {
public:
  CellBuffer() = default;
  CellBuffer(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  Rect area() const { return Rect{0, 0, width_, height_}; }
  bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

  const Cell& at(int x, int y) const { return cells_[static_cast<size_t>(y) * width_ + x]; }
  Cell& at(int x, int y) { return cells_[static_cast<size_t>(y) * width_ + x]; }
  const Cell* row(int y) const { return cells_.data() + static_cast<size_t>(y) * width_; }

  void resize(int width, int height);
  void reset();

  // Glyph replaced, style patched over the existing one.
  void set(int x, int y, uint32_t cp, const Style& style);
  void set_style(const Rect& r, const Style& style);
  // Every cell of r back to a blank.
  void clear_area(const Rect& r);

  // Draws at most max_width cells; returns the number of cells used.
  int put_string(int x, int y, const std::string& utf8, const Style& style, int max_width);
  int put_line(int x, int y, const Line& line, const Style& base, int max_width);

  bool operator==(const CellBuffer& o) const {
    return width_ == o.width_ && height_ == o.height_ && cells_ == o.cells_;
  }

private:
  int width_ = 0;
  int height_ = 0;
  std::vector<Cell> cells_;
};
