#pragma once
/*
 * Draw routines
 *
 * Purpose: one paint function per widget kind.
 * Contract: `area` is already clipped to the buffer; each routine paints its
 *           block (if any) first, then content into the inner area.
 */
#include "cell_buffer.hpp"
#include "widgets.hpp"

// Base style over the whole area, then the block; returns the content area.
inline Rect frame_inner(CellBuffer& buf, const std::optional<BlockSpec>& block, const Style& style, const Rect& area) {
  buf.set_style(area, style);
  return block ? draw_block(buf, *block, area) : area;
}

void draw_paragraph(CellBuffer& buf, const ParagraphState& p, const Rect& area);
void draw_list(CellBuffer& buf, const ListState& l, const Rect& area);
void draw_table(CellBuffer& buf, const TableState& t, const Rect& area);
void draw_tabs(CellBuffer& buf, const TabsState& t, const Rect& area);

void draw_gauge(CellBuffer& buf, const GaugeState& g, const Rect& area);
void draw_line_gauge(CellBuffer& buf, const LineGaugeState& g, const Rect& area);
void draw_bar_chart(CellBuffer& buf, const BarChartState& c, const Rect& area);
void draw_sparkline(CellBuffer& buf, const SparklineState& s, const Rect& area);
void draw_scrollbar(CellBuffer& buf, const ScrollbarState& s, const Rect& area);

void draw_chart(CellBuffer& buf, const ChartState& c, const Rect& area);
void draw_canvas(CellBuffer& buf, const CanvasState& c, const Rect& area);

void draw_clear(CellBuffer& buf, const Rect& area);
void draw_logo(CellBuffer& buf, const Rect& area);
