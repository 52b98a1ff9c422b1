#include "draw.hpp"
#include "layout.hpp"
#include <utility>
#include <vector>

using StyledRow = std::vector<std::pair<uint32_t, Style>>;

static StyledRow flatten(const Line& line) {
  StyledRow row;
  for (const auto& sp : line.spans)
    for (uint32_t cp : decode_utf8(sp.text)) row.emplace_back(cp, sp.style);
  return row;
}

static void wrap_row(const StyledRow& row, int width, bool trim, std::vector<StyledRow>& out) {
  if (row.empty()) { out.emplace_back(); return; }
  size_t pos = 0;
  bool first = true;
  while (pos < row.size()) {
    if (!first && trim) {
      while (pos < row.size() && row[pos].first == ' ') ++pos;
      if (pos >= row.size()) break;
    }
    size_t end = std::min(row.size(), pos + static_cast<size_t>(width));
    if (end < row.size()) {
      // break after the last space that fits, else hard-break
      size_t brk = end;
      while (brk > pos && row[brk].first != ' ' && row[brk - 1].first != ' ') --brk;
      if (brk > pos) end = brk;
    }
    out.emplace_back(row.begin() + static_cast<long>(pos), row.begin() + static_cast<long>(end));
    pos = end;
    first = false;
  }
}

void draw_paragraph(CellBuffer& buf, const ParagraphState& p, const Rect& area) {
  Rect in = frame_inner(buf, p.block, p.style, area);
  if (in.empty()) return;
  std::vector<StyledRow> rows;
  for (const auto& l : p.lines) {
    StyledRow r = flatten(l);
    if (p.wrap) {
      wrap_row(r, in.width, p.trim, rows);
    } else {
      size_t skip = std::min(r.size(), static_cast<size_t>(std::max(0, p.scroll_x)));
      rows.emplace_back(r.begin() + static_cast<long>(skip), r.end());
    }
  }
  int y = in.y;
  for (size_t i = static_cast<size_t>(std::max(0, p.scroll_y)); i < rows.size() && y < in.bottom(); ++i, ++y) {
    const StyledRow& r = rows[i];
    int len = std::min(in.width, static_cast<int>(r.size()));
    int x = in.x + aligned_offset(p.alignment, in.width, len);
    for (int k = 0; k < len; ++k) buf.set(x + k, y, r[k].first, r[k].second);
  }
}

static bool symbol_column(HighlightSpacing s, bool has_selection) {
  return s == HighlightSpacing::Always || (s == HighlightSpacing::WhenSelected && has_selection);
}

// first visible index so that `selected` stays on screen
static int visible_offset(int offset, int selected, int count, int rows) {
  int off = std::clamp(offset, 0, std::max(0, count - 1));
  if (selected >= 0 && selected < count) {
    if (selected < off) off = selected;
    if (selected >= off + rows) off = selected - rows + 1;
  }
  return off;
}

void draw_list(CellBuffer& buf, const ListState& l, const Rect& area) {
  Rect in = frame_inner(buf, l.block, l.style, area);
  if (in.empty() || l.items.empty()) return;
  const int n = static_cast<int>(l.items.size());
  const bool has_sel = l.selected >= 0 && l.selected < n;
  const int sym_w = symbol_column(l.spacing, has_sel) ? utf8_width(l.highlight_symbol) : 0;
  const int off = visible_offset(l.offset, l.selected, n, in.height);
  for (int i = 0; i < in.height && off + i < n; ++i) {
    const int idx = off + i;
    const int y = l.direction == ListDirection::TopToBottom ? in.y + i : in.bottom() - 1 - i;
    if (sym_w > 0 && idx == l.selected) buf.put_string(in.x, y, l.highlight_symbol, Style{}, sym_w);
    buf.put_line(in.x + sym_w, y, l.items[idx], Style{}, in.width - sym_w);
    if (idx == l.selected) buf.set_style(Rect{in.x, y, in.width, 1}, l.highlight_style);
  }
}

static int table_columns(const TableState& t) {
  if (!t.widths_pct.empty()) return static_cast<int>(t.widths_pct.size());
  size_t cols = t.header.size();
  for (const auto& r : t.rows) cols = std::max(cols, r.size());
  return std::max<int>(1, static_cast<int>(cols));
}

static void draw_table_row(CellBuffer& buf, const std::vector<TableCell>& cells, const std::vector<Rect>& cols,
                           int y, int height) {
  for (size_t c = 0; c < cells.size() && c < cols.size(); ++c) {
    const TableCell& cell = cells[c];
    for (int j = 0; j < height && j < static_cast<int>(cell.size()); ++j)
      buf.put_line(cols[c].x, y + j, cell[j], Style{}, cols[c].width);
  }
}

void draw_table(CellBuffer& buf, const TableState& t, const Rect& area) {
  Rect in = frame_inner(buf, t.block, t.style, area);
  if (in.empty()) return;
  const int n = static_cast<int>(t.rows.size());
  const bool has_sel = t.selected >= 0 && t.selected < n;
  const int sym_w = std::min(in.width, symbol_column(t.spacing, has_sel) ? utf8_width(t.highlight_symbol) : 0);
  const int ncols = table_columns(t);
  std::vector<Constraint> cons;
  for (int c = 0; c < ncols; ++c) {
    if (!t.widths_pct.empty()) cons.push_back(Constraint::percent(t.widths_pct[c]));
    else cons.push_back(Constraint::ratio(1, static_cast<uint32_t>(ncols)));
  }
  Rect cols_area{in.x + sym_w, in.y, in.width - sym_w, in.height};
  std::vector<Rect> cols = split(cols_area, Direction::Horizontal, cons, t.column_spacing, Margins{});

  int y = in.y;
  if (!t.header.empty()) {
    draw_table_row(buf, t.header, cols, y, 1);
    buf.set_style(Rect{in.x, y, in.width, 1}, t.header_style);
    ++y;
  }
  const int rh = std::max(1, t.row_height);
  const int visible = std::max(1, (in.bottom() - y) / rh);
  const int off = visible_offset(0, t.selected, n, visible);
  for (int i = off; i < n && y < in.bottom(); ++i, y += rh) {
    draw_table_row(buf, t.rows[i], cols, y, rh);
    if (i == t.selected) {
      if (sym_w > 0) buf.put_string(in.x, y, t.highlight_symbol, Style{}, sym_w);
      buf.set_style(Rect{in.x, y, in.width, std::min(rh, in.bottom() - y)}, t.row_highlight_style);
    }
  }
}

void draw_tabs(CellBuffer& buf, const TabsState& t, const Rect& area) {
  Rect in = frame_inner(buf, t.block, t.style, area);
  if (in.empty()) return;
  int x = in.x;
  const int y = in.y;
  const int right = in.right();
  for (size_t i = 0; i < t.titles.size() && x < right; ++i) {
    x += 1; // left padding
    if (x >= right) break;
    const Line& title = t.titles[i];
    int used = buf.put_line(x, y, title, Style{}, right - x);
    if (static_cast<int>(i) == t.selected) buf.set_style(Rect{x, y, used, 1}, t.highlight_style);
    x += used + 1; // right padding
    if (i + 1 < t.titles.size() && x < right && !t.divider.text.empty())
      x += buf.put_string(x, y, t.divider.text, t.divider.style, right - x);
  }
}
