#pragma once
/*
 * Block
 *
 * Purpose: optional frame around a widget (borders, title, padding).
 * Contract: draw_block paints the frame and returns the inner area left for content.
 */
#include <cstdint>
#include "cell_buffer.hpp"
#include "text.hpp"
#include "types.hpp"

enum BorderSide : uint8_t {
  BORDER_NONE   = 0,
  BORDER_LEFT   = 1,
  BORDER_RIGHT  = 2,
  BORDER_TOP    = 4,
  BORDER_BOTTOM = 8,
  BORDER_ALL    = 15,
};

enum class BorderType { Plain = 0, Thick = 1, Double = 2, Rounded = 3, QuadrantInside = 4, QuadrantOutside = 5 };

struct BlockSpec {
  uint8_t borders = BORDER_NONE;
  BorderType border_type = BorderType::Plain;
  Style border_style;
  int pad_left = 0, pad_top = 0, pad_right = 0, pad_bottom = 0;
  Line title;
  Alignment title_alignment = Alignment::Left;
};

Rect block_inner(const BlockSpec& b, const Rect& area);
Rect draw_block(CellBuffer& buf, const BlockSpec& b, const Rect& area);
