#include "cell_buffer.hpp"

CellBuffer::CellBuffer(int width, int height) { resize(width, height); }

void CellBuffer::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  cells_.assign(static_cast<size_t>(width_) * height_, Cell{});
}

void CellBuffer::reset() { std::fill(cells_.begin(), cells_.end(), Cell{}); }

void CellBuffer::set(int x, int y, uint32_t cp, const Style& style) {
  if (!contains(x, y)) return;
  Cell& c = at(x, y);
  c.codepoint = cp;
  c.style = patch_style(c.style, style);
}

void CellBuffer::set_style(const Rect& r, const Style& style) {
  Rect a = r.intersect(area());
  for (int y = a.top(); y < a.bottom(); ++y)
    for (int x = a.left(); x < a.right(); ++x) at(x, y).style = patch_style(at(x, y).style, style);
}

void CellBuffer::clear_area(const Rect& r) {
  Rect a = r.intersect(area());
  for (int y = a.top(); y < a.bottom(); ++y)
    for (int x = a.left(); x < a.right(); ++x) at(x, y) = Cell{};
}

int CellBuffer::put_string(int x, int y, const std::string& utf8, const Style& style, int max_width) {
  int used = 0;
  for (uint32_t cp : decode_utf8(utf8)) {
    if (used >= max_width) break;
    if (cp < 0x20 || cp == 0x7F) cp = ' ';
    set(x + used, y, cp, style);
    ++used;
  }
  return used;
}

int CellBuffer::put_line(int x, int y, const Line& line, const Style& base, int max_width) {
  int used = 0;
  for (const auto& sp : line.spans) {
    if (used >= max_width) break;
    used += put_string(x + used, y, sp.text, patch_style(base, sp.style), max_width - used);
  }
  return used;
}
