#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "abi_common.hpp"

// Every setter reads and validates its inputs before touching the record, so a
// failed call leaves the widget as it was.

#define TUIB_BLOCK_SETTERS(prefix, Handle, State)                                                        \
  TuibStatus tuib_##prefix##_set_block(Handle h, const TuibBlock* block, const TuibSpan* title, size_t n) { \
    return with_widget<State>("tuib_" #prefix "_set_block", h.id, [&](Engine& eng, State& w) {          \
      BlockSpec b;                                                                                       \
      TuibStatus st = read_block(eng, "tuib_" #prefix "_set_block", block, title, n, b);                \
      if (st != TUIB_OK) return st;                                                                      \
      w.block = std::move(b);                                                                            \
      return TUIB_OK;                                                                                    \
    });                                                                                                  \
  }                                                                                                      \
  TuibStatus tuib_##prefix##_clear_block(Handle h) {                                                     \
    return with_widget<State>("tuib_" #prefix "_clear_block", h.id, [](Engine&, State& w) {             \
      w.block.reset();                                                                                   \
      return TUIB_OK;                                                                                    \
    });                                                                                                  \
  }

static bool read_spacing(uint32_t raw, HighlightSpacing& out) {
  if (raw > static_cast<uint32_t>(HighlightSpacing::WhenSelected)) return false;
  out = static_cast<HighlightSpacing>(raw);
  return true;
}

static TuibStatus read_ratio(Engine& eng, const char* name, float raw, double& out) {
  if (!std::isfinite(raw)) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": ratio is not finite");
  out = std::clamp(static_cast<double>(raw), 0.0, 1.0);
  return TUIB_OK;
}

static TuibStatus read_values(Engine& eng, const char* name, const uint64_t* values, size_t n,
                              std::vector<uint64_t>& out) {
  if (!values && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null value array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.assign(values, values + n);
  return TUIB_OK;
}

static TuibStatus read_points(Engine& eng, const char* name, const TuibPoint* points, size_t n,
                              std::vector<std::pair<double, double>>& out) {
  if (!points && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null point array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.clear();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) out.emplace_back(points[i].x, points[i].y);
  return TUIB_OK;
}

static TuibStatus check_reserve(Engine& eng, const char* name, size_t additional) {
  std::string err;
  if (!eng.check_batch(additional, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  return TUIB_OK;
}

template <class V>
static void grow(V& v, size_t additional) {
  if (additional > v.max_size() - v.size()) throw std::length_error("reserve beyond max_size");
  v.reserve(v.size() + additional);
}

// One cell per span, each cell a single one-span line.
static std::vector<TableCell> cells_from_spans(std::vector<Span> spans) {
  std::vector<TableCell> cells;
  cells.reserve(spans.size());
  for (auto& sp : spans) {
    Line l;
    l.spans.push_back(std::move(sp));
    cells.push_back(TableCell{std::move(l)});
  }
  return cells;
}

static TuibStatus read_row(Engine& eng, const char* name, const TuibCellLines* cells, size_t n,
                           std::vector<TableCell>& out) {
  if (!cells && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null cell array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.clear();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    TableCell cell;
    TuibStatus st = read_lines(eng, name, cells[i].lines, cells[i].count, cell);
    if (st != TUIB_OK) return st;
    out.push_back(std::move(cell));
  }
  return TUIB_OK;
}

static bool read_bounds(double x_min, double x_max, double y_min, double y_max) {
  return std::isfinite(x_min) && std::isfinite(x_max) && std::isfinite(y_min) && std::isfinite(y_max) &&
         x_min <= x_max && y_min <= y_max;
}

extern "C" {

/* ---- paragraph ---- */

TuibStatus tuib_paragraph_new(const char* text, size_t len, TuibParagraph* out) {
  return guarded("tuib_paragraph_new", [&](Engine& eng) {
    if (!out) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_paragraph_new: null out handle");
    std::string s;
    TuibStatus st = read_text(eng, "tuib_paragraph_new", text, len, s);
    if (st != TUIB_OK) return st;
    ParagraphState p;
    p.lines = lines_from_text(s, Style{});
    out->id = eng.registry().create(std::move(p));
    eng.log().debug("tuib_paragraph_new: created paragraph id={:#x}", out->id);
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_new_empty(TuibParagraph* out) {
  return create_widget("tuib_paragraph_new_empty", out, ParagraphState{});
}

TuibStatus tuib_paragraph_free(TuibParagraph p) { return free_widget<ParagraphState>("tuib_paragraph_free", p.id); }

TuibStatus tuib_paragraph_append_line(TuibParagraph p, const char* text, size_t len, TuibStyle style) {
  return with_widget<ParagraphState>("tuib_paragraph_append_line", p.id, [&](Engine& eng, ParagraphState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_paragraph_append_line", text, len, s);
    if (st != TUIB_OK) return st;
    std::vector<Line> lines = lines_from_text(s, to_style(style));
    for (auto& l : lines) w.lines.push_back(std::move(l));
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_append_spans(TuibParagraph p, const TuibSpan* spans, size_t n) {
  return with_widget<ParagraphState>("tuib_paragraph_append_spans", p.id, [&](Engine& eng, ParagraphState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_paragraph_append_spans", spans, n, sp);
    if (st != TUIB_OK) return st;
    paragraph_append_spans(w, std::move(sp));
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_append_line_spans(TuibParagraph p, const TuibSpan* spans, size_t n) {
  return with_widget<ParagraphState>("tuib_paragraph_append_line_spans", p.id, [&](Engine& eng, ParagraphState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_paragraph_append_line_spans", spans, n, sp);
    if (st != TUIB_OK) return st;
    paragraph_append_line(w, std::move(sp));
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_append_lines(TuibParagraph p, const TuibLine* lines, size_t n) {
  return with_widget<ParagraphState>("tuib_paragraph_append_lines", p.id, [&](Engine& eng, ParagraphState& w) {
    std::vector<Line> ls;
    TuibStatus st = read_lines(eng, "tuib_paragraph_append_lines", lines, n, ls);
    if (st != TUIB_OK) return st;
    for (auto& l : ls) w.lines.push_back(std::move(l));
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_set_alignment(TuibParagraph p, uint32_t alignment) {
  return with_widget<ParagraphState>("tuib_paragraph_set_alignment", p.id, [&](Engine& eng, ParagraphState& w) {
    Alignment a;
    if (!to_alignment(alignment, a)) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_paragraph_set_alignment: bad alignment");
    w.alignment = a;
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_set_wrap(TuibParagraph p, bool wrap, bool trim) {
  return with_widget<ParagraphState>("tuib_paragraph_set_wrap", p.id, [&](Engine&, ParagraphState& w) {
    w.wrap = wrap;
    w.trim = trim;
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_set_scroll(TuibParagraph p, uint16_t x, uint16_t y) {
  return with_widget<ParagraphState>("tuib_paragraph_set_scroll", p.id, [&](Engine&, ParagraphState& w) {
    w.scroll_x = x;
    w.scroll_y = y;
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_set_style(TuibParagraph p, TuibStyle style) {
  return with_widget<ParagraphState>("tuib_paragraph_set_style", p.id, [&](Engine&, ParagraphState& w) {
    w.style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_paragraph_reserve_lines(TuibParagraph p, size_t additional) {
  return with_widget<ParagraphState>("tuib_paragraph_reserve_lines", p.id, [&](Engine& eng, ParagraphState& w) {
    TuibStatus st = check_reserve(eng, "tuib_paragraph_reserve_lines", additional);
    if (st != TUIB_OK) return st;
    grow(w.lines, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(paragraph, TuibParagraph, ParagraphState)

/* ---- list ---- */

TuibStatus tuib_list_new(TuibList* out) { return create_widget("tuib_list_new", out, ListState{}); }

TuibStatus tuib_list_free(TuibList l) { return free_widget<ListState>("tuib_list_free", l.id); }

TuibStatus tuib_list_append_item(TuibList l, const char* text, size_t len, TuibStyle style) {
  return with_widget<ListState>("tuib_list_append_item", l.id, [&](Engine& eng, ListState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_list_append_item", text, len, s);
    if (st != TUIB_OK) return st;
    w.items.push_back(line_from_text(s, to_style(style)));
    return TUIB_OK;
  });
}

TuibStatus tuib_list_append_item_spans(TuibList l, const TuibSpan* spans, size_t n) {
  return with_widget<ListState>("tuib_list_append_item_spans", l.id, [&](Engine& eng, ListState& w) {
    Line item;
    TuibStatus st = read_spans(eng, "tuib_list_append_item_spans", spans, n, item.spans);
    if (st != TUIB_OK) return st;
    w.items.push_back(std::move(item));
    return TUIB_OK;
  });
}

TuibStatus tuib_list_append_items(TuibList l, const TuibLine* items, size_t n) {
  return with_widget<ListState>("tuib_list_append_items", l.id, [&](Engine& eng, ListState& w) {
    std::vector<Line> ls;
    TuibStatus st = read_lines(eng, "tuib_list_append_items", items, n, ls);
    if (st != TUIB_OK) return st;
    for (auto& it : ls) w.items.push_back(std::move(it));
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_selected(TuibList l, int32_t index) {
  return with_widget<ListState>("tuib_list_set_selected", l.id, [&](Engine&, ListState& w) {
    w.selected = index < 0 ? -1 : index;
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_highlight_style(TuibList l, TuibStyle style) {
  return with_widget<ListState>("tuib_list_set_highlight_style", l.id, [&](Engine&, ListState& w) {
    w.highlight_style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_highlight_symbol(TuibList l, const char* text, size_t len) {
  return with_widget<ListState>("tuib_list_set_highlight_symbol", l.id, [&](Engine& eng, ListState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_list_set_highlight_symbol", text, len, s);
    if (st != TUIB_OK) return st;
    w.highlight_symbol = std::move(s);
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_direction(TuibList l, uint32_t direction) {
  return with_widget<ListState>("tuib_list_set_direction", l.id, [&](Engine& eng, ListState& w) {
    if (direction > static_cast<uint32_t>(ListDirection::BottomToTop))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_list_set_direction: bad direction");
    w.direction = static_cast<ListDirection>(direction);
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_scroll_offset(TuibList l, uint32_t offset) {
  return with_widget<ListState>("tuib_list_set_scroll_offset", l.id, [&](Engine&, ListState& w) {
    w.offset = static_cast<int>(std::min<uint32_t>(offset, INT32_MAX));
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_highlight_spacing(TuibList l, uint32_t spacing) {
  return with_widget<ListState>("tuib_list_set_highlight_spacing", l.id, [&](Engine& eng, ListState& w) {
    HighlightSpacing s;
    if (!read_spacing(spacing, s))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_list_set_highlight_spacing: bad spacing");
    w.spacing = s;
    return TUIB_OK;
  });
}

TuibStatus tuib_list_set_style(TuibList l, TuibStyle style) {
  return with_widget<ListState>("tuib_list_set_style", l.id, [&](Engine&, ListState& w) {
    w.style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_list_reserve_items(TuibList l, size_t additional) {
  return with_widget<ListState>("tuib_list_reserve_items", l.id, [&](Engine& eng, ListState& w) {
    TuibStatus st = check_reserve(eng, "tuib_list_reserve_items", additional);
    if (st != TUIB_OK) return st;
    grow(w.items, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(list, TuibList, ListState)

/* ---- table ---- */

TuibStatus tuib_table_new(TuibTable* out) { return create_widget("tuib_table_new", out, TableState{}); }

TuibStatus tuib_table_free(TuibTable t) { return free_widget<TableState>("tuib_table_free", t.id); }

TuibStatus tuib_table_set_header_spans(TuibTable t, const TuibSpan* cells, size_t n) {
  return with_widget<TableState>("tuib_table_set_header_spans", t.id, [&](Engine& eng, TableState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_table_set_header_spans", cells, n, sp);
    if (st != TUIB_OK) return st;
    w.header = cells_from_spans(std::move(sp));
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_header_style(TuibTable t, TuibStyle style) {
  return with_widget<TableState>("tuib_table_set_header_style", t.id, [&](Engine&, TableState& w) {
    w.header_style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_table_append_row_spans(TuibTable t, const TuibSpan* cells, size_t n) {
  return with_widget<TableState>("tuib_table_append_row_spans", t.id, [&](Engine& eng, TableState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_table_append_row_spans", cells, n, sp);
    if (st != TUIB_OK) return st;
    w.rows.push_back(cells_from_spans(std::move(sp)));
    return TUIB_OK;
  });
}

TuibStatus tuib_table_append_row_cells(TuibTable t, const TuibCellLines* cells, size_t n) {
  return with_widget<TableState>("tuib_table_append_row_cells", t.id, [&](Engine& eng, TableState& w) {
    std::vector<TableCell> row;
    TuibStatus st = read_row(eng, "tuib_table_append_row_cells", cells, n, row);
    if (st != TUIB_OK) return st;
    w.rows.push_back(std::move(row));
    return TUIB_OK;
  });
}

TuibStatus tuib_table_append_rows(TuibTable t, const TuibRowCells* rows, size_t n) {
  return with_widget<TableState>("tuib_table_append_rows", t.id, [&](Engine& eng, TableState& w) {
    if (!rows && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_table_append_rows: null row array");
    std::string err;
    if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, "tuib_table_append_rows: " + err);
    std::vector<std::vector<TableCell>> batch;
    batch.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      std::vector<TableCell> row;
      TuibStatus st = read_row(eng, "tuib_table_append_rows", rows[i].cells, rows[i].count, row);
      if (st != TUIB_OK) return st;
      batch.push_back(std::move(row));
    }
    for (auto& r : batch) w.rows.push_back(std::move(r));
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_widths_percent(TuibTable t, const uint16_t* widths, size_t n) {
  return with_widget<TableState>("tuib_table_set_widths_percent", t.id, [&](Engine& eng, TableState& w) {
    if (!widths && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_table_set_widths_percent: null widths");
    std::string err;
    if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, "tuib_table_set_widths_percent: " + err);
    if (std::any_of(widths, widths + n, [](uint16_t v) { return v > 100; }))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_table_set_widths_percent: width above 100%");
    w.widths_pct.assign(widths, widths + n);
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_column_spacing(TuibTable t, uint16_t spacing) {
  return with_widget<TableState>("tuib_table_set_column_spacing", t.id, [&](Engine&, TableState& w) {
    w.column_spacing = spacing;
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_selected(TuibTable t, int32_t row) {
  return with_widget<TableState>("tuib_table_set_selected", t.id, [&](Engine&, TableState& w) {
    w.selected = row < 0 ? -1 : row;
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_row_highlight_style(TuibTable t, TuibStyle style) {
  return with_widget<TableState>("tuib_table_set_row_highlight_style", t.id, [&](Engine&, TableState& w) {
    w.row_highlight_style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_highlight_symbol(TuibTable t, const char* text, size_t len) {
  return with_widget<TableState>("tuib_table_set_highlight_symbol", t.id, [&](Engine& eng, TableState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_table_set_highlight_symbol", text, len, s);
    if (st != TUIB_OK) return st;
    w.highlight_symbol = std::move(s);
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_row_height(TuibTable t, uint16_t height) {
  return with_widget<TableState>("tuib_table_set_row_height", t.id, [&](Engine& eng, TableState& w) {
    if (height == 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_table_set_row_height: height must be at least 1");
    w.row_height = height;
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_highlight_spacing(TuibTable t, uint32_t spacing) {
  return with_widget<TableState>("tuib_table_set_highlight_spacing", t.id, [&](Engine& eng, TableState& w) {
    HighlightSpacing s;
    if (!read_spacing(spacing, s))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_table_set_highlight_spacing: bad spacing");
    w.spacing = s;
    return TUIB_OK;
  });
}

TuibStatus tuib_table_set_style(TuibTable t, TuibStyle style) {
  return with_widget<TableState>("tuib_table_set_style", t.id, [&](Engine&, TableState& w) {
    w.style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_table_reserve_rows(TuibTable t, size_t additional) {
  return with_widget<TableState>("tuib_table_reserve_rows", t.id, [&](Engine& eng, TableState& w) {
    TuibStatus st = check_reserve(eng, "tuib_table_reserve_rows", additional);
    if (st != TUIB_OK) return st;
    grow(w.rows, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(table, TuibTable, TableState)

/* ---- gauge ---- */

TuibStatus tuib_gauge_new(TuibGauge* out) { return create_widget("tuib_gauge_new", out, GaugeState{}); }

TuibStatus tuib_gauge_free(TuibGauge g) { return free_widget<GaugeState>("tuib_gauge_free", g.id); }

TuibStatus tuib_gauge_set_ratio(TuibGauge g, float ratio) {
  return with_widget<GaugeState>("tuib_gauge_set_ratio", g.id, [&](Engine& eng, GaugeState& w) {
    double r;
    TuibStatus st = read_ratio(eng, "tuib_gauge_set_ratio", ratio, r);
    if (st != TUIB_OK) return st;
    w.ratio = r;
    return TUIB_OK;
  });
}

TuibStatus tuib_gauge_set_label(TuibGauge g, const char* text, size_t len, TuibStyle style) {
  return with_widget<GaugeState>("tuib_gauge_set_label", g.id, [&](Engine& eng, GaugeState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_gauge_set_label", text, len, s);
    if (st != TUIB_OK) return st;
    w.label = Span{std::move(s), to_style(style)};
    return TUIB_OK;
  });
}

TuibStatus tuib_gauge_set_label_spans(TuibGauge g, const TuibSpan* spans, size_t n) {
  return with_widget<GaugeState>("tuib_gauge_set_label_spans", g.id, [&](Engine& eng, GaugeState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_gauge_set_label_spans", spans, n, sp);
    if (st != TUIB_OK) return st;
    gauge_set_label_spans(w, sp);
    return TUIB_OK;
  });
}

TuibStatus tuib_gauge_set_styles(TuibGauge g, TuibStyle style, TuibStyle gauge_style) {
  return with_widget<GaugeState>("tuib_gauge_set_styles", g.id, [&](Engine&, GaugeState& w) {
    w.style = to_style(style);
    w.gauge_style = to_style(gauge_style);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(gauge, TuibGauge, GaugeState)

/* ---- line gauge ---- */

TuibStatus tuib_linegauge_new(TuibLineGauge* out) { return create_widget("tuib_linegauge_new", out, LineGaugeState{}); }

TuibStatus tuib_linegauge_free(TuibLineGauge g) { return free_widget<LineGaugeState>("tuib_linegauge_free", g.id); }

TuibStatus tuib_linegauge_set_ratio(TuibLineGauge g, float ratio) {
  return with_widget<LineGaugeState>("tuib_linegauge_set_ratio", g.id, [&](Engine& eng, LineGaugeState& w) {
    double r;
    TuibStatus st = read_ratio(eng, "tuib_linegauge_set_ratio", ratio, r);
    if (st != TUIB_OK) return st;
    w.ratio = r;
    return TUIB_OK;
  });
}

TuibStatus tuib_linegauge_set_label(TuibLineGauge g, const char* text, size_t len, TuibStyle style) {
  return with_widget<LineGaugeState>("tuib_linegauge_set_label", g.id, [&](Engine& eng, LineGaugeState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_linegauge_set_label", text, len, s);
    if (st != TUIB_OK) return st;
    w.label = line_from_text(s, to_style(style));
    return TUIB_OK;
  });
}

TuibStatus tuib_linegauge_set_label_spans(TuibLineGauge g, const TuibSpan* spans, size_t n) {
  return with_widget<LineGaugeState>("tuib_linegauge_set_label_spans", g.id, [&](Engine& eng, LineGaugeState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_linegauge_set_label_spans", spans, n, sp);
    if (st != TUIB_OK) return st;
    line_gauge_set_label_spans(w, std::move(sp));
    return TUIB_OK;
  });
}

TuibStatus tuib_linegauge_set_styles(TuibLineGauge g, TuibStyle style, TuibStyle filled, TuibStyle unfilled) {
  return with_widget<LineGaugeState>("tuib_linegauge_set_styles", g.id, [&](Engine&, LineGaugeState& w) {
    w.style = to_style(style);
    w.filled_style = to_style(filled);
    w.unfilled_style = to_style(unfilled);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(linegauge, TuibLineGauge, LineGaugeState)

/* ---- tabs ---- */

TuibStatus tuib_tabs_new(TuibTabs* out) { return create_widget("tuib_tabs_new", out, TabsState{}); }

TuibStatus tuib_tabs_free(TuibTabs t) { return free_widget<TabsState>("tuib_tabs_free", t.id); }

TuibStatus tuib_tabs_append_title(TuibTabs t, const char* text, size_t len, TuibStyle style) {
  return with_widget<TabsState>("tuib_tabs_append_title", t.id, [&](Engine& eng, TabsState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_tabs_append_title", text, len, s);
    if (st != TUIB_OK) return st;
    w.titles.push_back(line_from_text(s, to_style(style)));
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_append_title_spans(TuibTabs t, const TuibSpan* spans, size_t n) {
  return with_widget<TabsState>("tuib_tabs_append_title_spans", t.id, [&](Engine& eng, TabsState& w) {
    Line title;
    TuibStatus st = read_spans(eng, "tuib_tabs_append_title_spans", spans, n, title.spans);
    if (st != TUIB_OK) return st;
    w.titles.push_back(std::move(title));
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_set_selected(TuibTabs t, uint32_t index) {
  return with_widget<TabsState>("tuib_tabs_set_selected", t.id, [&](Engine&, TabsState& w) {
    w.selected = static_cast<int>(std::min<uint32_t>(index, INT32_MAX));
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_set_styles(TuibTabs t, TuibStyle unselected, TuibStyle selected) {
  return with_widget<TabsState>("tuib_tabs_set_styles", t.id, [&](Engine&, TabsState& w) {
    w.style = to_style(unselected);
    w.highlight_style = to_style(selected);
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_set_divider(TuibTabs t, const char* text, size_t len, TuibStyle style) {
  return with_widget<TabsState>("tuib_tabs_set_divider", t.id, [&](Engine& eng, TabsState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_tabs_set_divider", text, len, s);
    if (st != TUIB_OK) return st;
    w.divider = Span{std::move(s), to_style(style)};
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_set_divider_spans(TuibTabs t, const TuibSpan* spans, size_t n) {
  return with_widget<TabsState>("tuib_tabs_set_divider_spans", t.id, [&](Engine& eng, TabsState& w) {
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_tabs_set_divider_spans", spans, n, sp);
    if (st != TUIB_OK) return st;
    tabs_set_divider_spans(w, sp);
    return TUIB_OK;
  });
}

TuibStatus tuib_tabs_reserve_titles(TuibTabs t, size_t additional) {
  return with_widget<TabsState>("tuib_tabs_reserve_titles", t.id, [&](Engine& eng, TabsState& w) {
    TuibStatus st = check_reserve(eng, "tuib_tabs_reserve_titles", additional);
    if (st != TUIB_OK) return st;
    grow(w.titles, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(tabs, TuibTabs, TabsState)

/* ---- bar chart ---- */

TuibStatus tuib_barchart_new(TuibBarChart* out) { return create_widget("tuib_barchart_new", out, BarChartState{}); }

TuibStatus tuib_barchart_free(TuibBarChart c) { return free_widget<BarChartState>("tuib_barchart_free", c.id); }

TuibStatus tuib_barchart_set_values(TuibBarChart c, const uint64_t* values, size_t n) {
  return with_widget<BarChartState>("tuib_barchart_set_values", c.id, [&](Engine& eng, BarChartState& w) {
    std::vector<uint64_t> v;
    TuibStatus st = read_values(eng, "tuib_barchart_set_values", values, n, v);
    if (st != TUIB_OK) return st;
    w.values = std::move(v);
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_append_bar(TuibBarChart c, uint64_t value, const char* label, size_t len) {
  return with_widget<BarChartState>("tuib_barchart_append_bar", c.id, [&](Engine& eng, BarChartState& w) {
    std::string s;
    TuibStatus st = read_text(eng, "tuib_barchart_append_bar", label, len, s);
    if (st != TUIB_OK) return st;
    // labels stay index-aligned with values
    w.labels.resize(w.values.size());
    w.values.push_back(value);
    w.labels.push_back(Span{std::move(s), Style{}});
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_set_labels_spans(TuibBarChart c, const TuibLine* labels, size_t n) {
  return with_widget<BarChartState>("tuib_barchart_set_labels_spans", c.id, [&](Engine& eng, BarChartState& w) {
    std::vector<Line> ls;
    TuibStatus st = read_lines(eng, "tuib_barchart_set_labels_spans", labels, n, ls);
    if (st != TUIB_OK) return st;
    std::vector<std::vector<Span>> runs;
    runs.reserve(ls.size());
    for (auto& l : ls) runs.push_back(std::move(l.spans));
    bar_chart_set_labels(w, runs);
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_set_bar_width(TuibBarChart c, uint16_t width) {
  return with_widget<BarChartState>("tuib_barchart_set_bar_width", c.id, [&](Engine& eng, BarChartState& w) {
    if (width == 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_barchart_set_bar_width: width must be at least 1");
    w.bar_width = width;
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_set_bar_gap(TuibBarChart c, uint16_t gap) {
  return with_widget<BarChartState>("tuib_barchart_set_bar_gap", c.id, [&](Engine&, BarChartState& w) {
    w.bar_gap = gap;
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_set_styles(TuibBarChart c, TuibStyle bar, TuibStyle value, TuibStyle label) {
  return with_widget<BarChartState>("tuib_barchart_set_styles", c.id, [&](Engine&, BarChartState& w) {
    w.bar_style = to_style(bar);
    w.value_style = to_style(value);
    w.label_style = to_style(label);
    return TUIB_OK;
  });
}

TuibStatus tuib_barchart_reserve_bars(TuibBarChart c, size_t additional) {
  return with_widget<BarChartState>("tuib_barchart_reserve_bars", c.id, [&](Engine& eng, BarChartState& w) {
    TuibStatus st = check_reserve(eng, "tuib_barchart_reserve_bars", additional);
    if (st != TUIB_OK) return st;
    grow(w.values, additional);
    grow(w.labels, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(barchart, TuibBarChart, BarChartState)

/* ---- sparkline ---- */

TuibStatus tuib_sparkline_new(TuibSparkline* out) { return create_widget("tuib_sparkline_new", out, SparklineState{}); }

TuibStatus tuib_sparkline_free(TuibSparkline s) { return free_widget<SparklineState>("tuib_sparkline_free", s.id); }

TuibStatus tuib_sparkline_set_values(TuibSparkline s, const uint64_t* values, size_t n) {
  return with_widget<SparklineState>("tuib_sparkline_set_values", s.id, [&](Engine& eng, SparklineState& w) {
    std::vector<uint64_t> v;
    TuibStatus st = read_values(eng, "tuib_sparkline_set_values", values, n, v);
    if (st != TUIB_OK) return st;
    w.values = std::move(v);
    return TUIB_OK;
  });
}

TuibStatus tuib_sparkline_append_value(TuibSparkline s, uint64_t value) {
  return with_widget<SparklineState>("tuib_sparkline_append_value", s.id, [&](Engine&, SparklineState& w) {
    w.values.push_back(value);
    return TUIB_OK;
  });
}

TuibStatus tuib_sparkline_set_max(TuibSparkline s, uint64_t max) {
  return with_widget<SparklineState>("tuib_sparkline_set_max", s.id, [&](Engine&, SparklineState& w) {
    w.max = max;
    return TUIB_OK;
  });
}

TuibStatus tuib_sparkline_set_style(TuibSparkline s, TuibStyle style) {
  return with_widget<SparklineState>("tuib_sparkline_set_style", s.id, [&](Engine&, SparklineState& w) {
    w.style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_sparkline_reserve_values(TuibSparkline s, size_t additional) {
  return with_widget<SparklineState>("tuib_sparkline_reserve_values", s.id, [&](Engine& eng, SparklineState& w) {
    TuibStatus st = check_reserve(eng, "tuib_sparkline_reserve_values", additional);
    if (st != TUIB_OK) return st;
    grow(w.values, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(sparkline, TuibSparkline, SparklineState)

/* ---- chart ---- */

static Axis* chart_axis(ChartState& c, uint32_t axis) {
  if (axis == TUIB_AXIS_X) return &c.x_axis;
  if (axis == TUIB_AXIS_Y) return &c.y_axis;
  return nullptr;
}

TuibStatus tuib_chart_new(TuibChart* out) { return create_widget("tuib_chart_new", out, ChartState{}); }

TuibStatus tuib_chart_free(TuibChart c) { return free_widget<ChartState>("tuib_chart_free", c.id); }

TuibStatus tuib_chart_add_dataset(TuibChart c, const char* name, size_t len, const TuibPoint* points, size_t n,
                                  TuibStyle style, uint32_t graph_type, size_t* out_index) {
  return with_widget<ChartState>("tuib_chart_add_dataset", c.id, [&](Engine& eng, ChartState& w) {
    if (graph_type > static_cast<uint32_t>(GraphType::Scatter))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_add_dataset: bad graph type");
    Dataset ds;
    TuibStatus st = read_text(eng, "tuib_chart_add_dataset", name, len, ds.name);
    if (st != TUIB_OK) return st;
    st = read_points(eng, "tuib_chart_add_dataset", points, n, ds.points);
    if (st != TUIB_OK) return st;
    ds.style = to_style(style);
    ds.graph_type = static_cast<GraphType>(graph_type);
    w.datasets.push_back(std::move(ds));
    if (out_index) *out_index = w.datasets.size() - 1;
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_append_points(TuibChart c, size_t dataset, const TuibPoint* points, size_t n) {
  return with_widget<ChartState>("tuib_chart_append_points", c.id, [&](Engine& eng, ChartState& w) {
    if (dataset >= w.datasets.size())
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_append_points: no dataset " + std::to_string(dataset));
    std::vector<std::pair<double, double>> pts;
    TuibStatus st = read_points(eng, "tuib_chart_append_points", points, n, pts);
    if (st != TUIB_OK) return st;
    auto& dst = w.datasets[dataset].points;
    dst.insert(dst.end(), pts.begin(), pts.end());
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_reserve_datasets(TuibChart c, size_t additional) {
  return with_widget<ChartState>("tuib_chart_reserve_datasets", c.id, [&](Engine& eng, ChartState& w) {
    TuibStatus st = check_reserve(eng, "tuib_chart_reserve_datasets", additional);
    if (st != TUIB_OK) return st;
    grow(w.datasets, additional);
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_reserve_points(TuibChart c, size_t dataset, size_t additional) {
  return with_widget<ChartState>("tuib_chart_reserve_points", c.id, [&](Engine& eng, ChartState& w) {
    if (dataset >= w.datasets.size())
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_reserve_points: no dataset " + std::to_string(dataset));
    TuibStatus st = check_reserve(eng, "tuib_chart_reserve_points", additional);
    if (st != TUIB_OK) return st;
    grow(w.datasets[dataset].points, additional);
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_set_axis(TuibChart c, uint32_t axis, const char* title, size_t len, double min, double max,
                               TuibStyle style) {
  return with_widget<ChartState>("tuib_chart_set_axis", c.id, [&](Engine& eng, ChartState& w) {
    Axis* a = chart_axis(w, axis);
    if (!a) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_set_axis: bad axis");
    if (!std::isfinite(min) || !std::isfinite(max) || min > max)
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_set_axis: bounds must be finite with min <= max");
    std::string t;
    TuibStatus st = read_text(eng, "tuib_chart_set_axis", title, len, t);
    if (st != TUIB_OK) return st;
    a->title = std::move(t);
    a->min = min;
    a->max = max;
    a->style = to_style(style);
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_set_axis_labels_spans(TuibChart c, uint32_t axis, const TuibSpan* labels, size_t n) {
  return with_widget<ChartState>("tuib_chart_set_axis_labels_spans", c.id, [&](Engine& eng, ChartState& w) {
    Axis* a = chart_axis(w, axis);
    if (!a) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_set_axis_labels_spans: bad axis");
    std::vector<Span> sp;
    TuibStatus st = read_spans(eng, "tuib_chart_set_axis_labels_spans", labels, n, sp);
    if (st != TUIB_OK) return st;
    a->labels.clear();
    for (auto& s : sp) {
      Line l;
      l.spans.push_back(std::move(s));
      a->labels.push_back(std::move(l));
    }
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_set_legend_position(TuibChart c, uint32_t position) {
  return with_widget<ChartState>("tuib_chart_set_legend_position", c.id, [&](Engine& eng, ChartState& w) {
    if (position > static_cast<uint32_t>(LegendPosition::None))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_chart_set_legend_position: bad position");
    w.legend = static_cast<LegendPosition>(position);
    return TUIB_OK;
  });
}

TuibStatus tuib_chart_set_style(TuibChart c, TuibStyle style) {
  return with_widget<ChartState>("tuib_chart_set_style", c.id, [&](Engine&, ChartState& w) {
    w.style = to_style(style);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(chart, TuibChart, ChartState)

/* ---- scrollbar ---- */

TuibStatus tuib_scrollbar_new(uint32_t side, TuibScrollbar* out) {
  return guarded("tuib_scrollbar_new", [&](Engine& eng) {
    if (!TUIB_ENABLE_SCROLLBAR) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_scrollbar_new: scrollbar support not built");
    if (!out) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_scrollbar_new: null out handle");
    if (side > static_cast<uint32_t>(ScrollbarSide::HorizontalBottom))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_scrollbar_new: bad side");
    ScrollbarState s;
    s.side = static_cast<ScrollbarSide>(side);
    out->id = eng.registry().create(std::move(s));
    eng.log().debug("tuib_scrollbar_new: created scrollbar id={:#x}", out->id);
    return TUIB_OK;
  });
}

TuibStatus tuib_scrollbar_free(TuibScrollbar s) { return free_widget<ScrollbarState>("tuib_scrollbar_free", s.id); }

TuibStatus tuib_scrollbar_configure(TuibScrollbar s, uint32_t side, uint32_t content_length, uint32_t position,
                                    uint32_t viewport_length) {
  return with_widget<ScrollbarState>("tuib_scrollbar_configure", s.id, [&](Engine& eng, ScrollbarState& w) {
    if (side > static_cast<uint32_t>(ScrollbarSide::HorizontalBottom))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_scrollbar_configure: bad side");
    w.side = static_cast<ScrollbarSide>(side);
    w.content_length = static_cast<int>(std::min<uint32_t>(content_length, INT32_MAX));
    w.position = static_cast<int>(std::min<uint32_t>(position, INT32_MAX));
    w.viewport_length = static_cast<int>(std::min<uint32_t>(viewport_length, INT32_MAX));
    return TUIB_OK;
  });
}

TuibStatus tuib_scrollbar_set_styles(TuibScrollbar s, TuibStyle thumb, TuibStyle track) {
  return with_widget<ScrollbarState>("tuib_scrollbar_set_styles", s.id, [&](Engine&, ScrollbarState& w) {
    w.thumb_style = to_style(thumb);
    w.track_style = to_style(track);
    return TUIB_OK;
  });
}

/* ---- canvas ---- */

TuibStatus tuib_canvas_new(double x_min, double x_max, double y_min, double y_max, TuibCanvas* out) {
  return guarded("tuib_canvas_new", [&](Engine& eng) {
    if (!TUIB_ENABLE_CANVAS) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_new: canvas support not built");
    if (!out) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_new: null out handle");
    if (!read_bounds(x_min, x_max, y_min, y_max))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_new: bounds must be finite with min <= max");
    CanvasState c;
    c.x_min = x_min;
    c.x_max = x_max;
    c.y_min = y_min;
    c.y_max = y_max;
    out->id = eng.registry().create(std::move(c));
    eng.log().debug("tuib_canvas_new: created canvas id={:#x}", out->id);
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_free(TuibCanvas c) { return free_widget<CanvasState>("tuib_canvas_free", c.id); }

TuibStatus tuib_canvas_set_bounds(TuibCanvas c, double x_min, double x_max, double y_min, double y_max) {
  return with_widget<CanvasState>("tuib_canvas_set_bounds", c.id, [&](Engine& eng, CanvasState& w) {
    if (!read_bounds(x_min, x_max, y_min, y_max))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_set_bounds: bounds must be finite with min <= max");
    w.x_min = x_min;
    w.x_max = x_max;
    w.y_min = y_min;
    w.y_max = y_max;
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_set_background(TuibCanvas c, uint32_t color) {
  return with_widget<CanvasState>("tuib_canvas_set_background", c.id, [&](Engine&, CanvasState& w) {
    w.background = decode_color(color);
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_set_marker(TuibCanvas c, uint32_t marker) {
  return with_widget<CanvasState>("tuib_canvas_set_marker", c.id, [&](Engine& eng, CanvasState& w) {
    if (marker > static_cast<uint32_t>(Marker::HalfBlock))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_set_marker: bad marker");
    w.marker = static_cast<Marker>(marker);
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_add_line(TuibCanvas c, double x1, double y1, double x2, double y2, TuibStyle style) {
  return with_widget<CanvasState>("tuib_canvas_add_line", c.id, [&](Engine& eng, CanvasState& w) {
    if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) || !std::isfinite(y2))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_add_line: non-finite coordinate");
    w.lines.push_back(CanvasLine{x1, y1, x2, y2, to_style(style)});
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_add_rect(TuibCanvas c, double x, double y, double width, double height, TuibStyle style) {
  return with_widget<CanvasState>("tuib_canvas_add_rect", c.id, [&](Engine& eng, CanvasState& w) {
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) || !std::isfinite(height))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_add_rect: non-finite coordinate");
    if (width < 0.0 || height < 0.0)
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_canvas_add_rect: negative size");
    w.rects.push_back(CanvasRect{x, y, width, height, to_style(style)});
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_add_points(TuibCanvas c, const TuibPoint* points, size_t n, TuibStyle style) {
  return with_widget<CanvasState>("tuib_canvas_add_points", c.id, [&](Engine& eng, CanvasState& w) {
    CanvasPoints pts;
    TuibStatus st = read_points(eng, "tuib_canvas_add_points", points, n, pts.coords);
    if (st != TUIB_OK) return st;
    pts.style = to_style(style);
    w.points.push_back(std::move(pts));
    return TUIB_OK;
  });
}

TuibStatus tuib_canvas_reserve_shapes(TuibCanvas c, size_t additional) {
  return with_widget<CanvasState>("tuib_canvas_reserve_shapes", c.id, [&](Engine& eng, CanvasState& w) {
    TuibStatus st = check_reserve(eng, "tuib_canvas_reserve_shapes", additional);
    if (st != TUIB_OK) return st;
    grow(w.lines, additional);
    grow(w.rects, additional);
    grow(w.points, additional);
    return TUIB_OK;
  });
}

TUIB_BLOCK_SETTERS(canvas, TuibCanvas, CanvasState)

}
