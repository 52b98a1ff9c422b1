#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Rect/Alignment/Direction).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <algorithm>

enum class Alignment { Left = 0, Center = 1, Right = 2 };
enum class Direction { Vertical = 0, Horizontal = 1 };

struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  int left() const { return x; }
  int top() const { return y; }
  int right() const { return x + width; }
  int bottom() const { return y + height; }
  long area() const { return static_cast<long>(width) * height; }
  bool empty() const { return width <= 0 || height <= 0; }
  bool operator==(const Rect&) const = default;

  Rect intersect(const Rect& o) const {
    int x0 = std::max(x, o.x), y0 = std::max(y, o.y);
    int x1 = std::min(right(), o.right()), y1 = std::min(bottom(), o.bottom());
    if (x1 <= x0 || y1 <= y0) return Rect{x0, y0, 0, 0};
    return Rect{x0, y0, x1 - x0, y1 - y0};
  }
};

// offset of the first column for a run of `len` cells inside `width`
inline int aligned_offset(Alignment a, int width, int len) {
  if (len >= width) return 0;
  switch (a) {
    case Alignment::Left: return 0;
    case Alignment::Center: return (width - len) / 2;
    case Alignment::Right: return width - len;
  }
  return 0;
}
