#include "block.hpp"

struct BorderGlyphs {
  uint32_t horizontal_top, horizontal_bottom, vertical_left, vertical_right;
  uint32_t top_left, top_right, bottom_left, bottom_right;
};

static BorderGlyphs glyphs_for(BorderType t) {
  switch (t) {
    case BorderType::Plain: return {0x2500, 0x2500, 0x2502, 0x2502, 0x250C, 0x2510, 0x2514, 0x2518};
    case BorderType::Thick: return {0x2501, 0x2501, 0x2503, 0x2503, 0x250F, 0x2513, 0x2517, 0x251B};
    case BorderType::Double: return {0x2550, 0x2550, 0x2551, 0x2551, 0x2554, 0x2557, 0x255A, 0x255D};
    case BorderType::Rounded: return {0x2500, 0x2500, 0x2502, 0x2502, 0x256D, 0x256E, 0x2570, 0x256F};
    case BorderType::QuadrantInside: return {0x2584, 0x2580, 0x2590, 0x258C, 0x2597, 0x2596, 0x259D, 0x2598};
    case BorderType::QuadrantOutside: return {0x2580, 0x2584, 0x258C, 0x2590, 0x259B, 0x259C, 0x2599, 0x259F};
  }
  return glyphs_for(BorderType::Plain);
}

Rect block_inner(const BlockSpec& b, const Rect& area) {
  int l = (b.borders & BORDER_LEFT) ? 1 : 0;
  int r = (b.borders & BORDER_RIGHT) ? 1 : 0;
  int t = (b.borders & BORDER_TOP) ? 1 : 0;
  int bt = (b.borders & BORDER_BOTTOM) ? 1 : 0;
  // a title needs a row even without a top border
  if (!t && !b.title.spans.empty()) t = 1;
  Rect in = area;
  in.x += std::min(area.width, l + b.pad_left);
  in.width = std::max(0, area.width - l - r - b.pad_left - b.pad_right);
  in.y += std::min(area.height, t + b.pad_top);
  in.height = std::max(0, area.height - t - bt - b.pad_top - b.pad_bottom);
  return in;
}

Rect draw_block(CellBuffer& buf, const BlockSpec& b, const Rect& area) {
  if (area.empty()) return area;
  const BorderGlyphs g = glyphs_for(b.border_type);
  const bool L = b.borders & BORDER_LEFT, R = b.borders & BORDER_RIGHT;
  const bool T = b.borders & BORDER_TOP, B = b.borders & BORDER_BOTTOM;
  const int x0 = area.left(), x1 = area.right() - 1, y0 = area.top(), y1 = area.bottom() - 1;

  if (T) for (int x = x0; x <= x1; ++x) buf.set(x, y0, g.horizontal_top, b.border_style);
  if (B) for (int x = x0; x <= x1; ++x) buf.set(x, y1, g.horizontal_bottom, b.border_style);
  if (L) for (int y = y0; y <= y1; ++y) buf.set(x0, y, g.vertical_left, b.border_style);
  if (R) for (int y = y0; y <= y1; ++y) buf.set(x1, y, g.vertical_right, b.border_style);
  if (T && L) buf.set(x0, y0, g.top_left, b.border_style);
  if (T && R) buf.set(x1, y0, g.top_right, b.border_style);
  if (B && L) buf.set(x0, y1, g.bottom_left, b.border_style);
  if (B && R) buf.set(x1, y1, g.bottom_right, b.border_style);

  if (!b.title.spans.empty()) {
    int tx = x0 + (L ? 1 : 0);
    int tw = area.width - (L ? 1 : 0) - (R ? 1 : 0);
    if (tw > 0) {
      int len = std::min(tw, b.title.width());
      int off = aligned_offset(b.title_alignment, tw, len);
      buf.put_line(tx + off, y0, b.title, Style{}, len);
    }
  }
  return block_inner(b, area);
}
