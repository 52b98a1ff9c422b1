#pragma once
/*
 * tuibridge C interface
 *
 * Purpose: flat, C-callable surface for building and rendering terminal UIs.
 * Rules: widgets live behind per-kind opaque handles (id 0 is never valid);
 *        text is borrowed for the duration of a call only; every fallible call
 *        returns a TuibStatus and reports details through tuib_last_error.
 */
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum TuibStatus {
  TUIB_OK = 0,
  TUIB_ERR_INVALID_HANDLE = 1,
  TUIB_ERR_INVALID_ARGUMENT = 2,
  TUIB_ERR_CAPACITY = 3,
  TUIB_ERR_TERMINAL_UNAVAILABLE = 4,
  TUIB_ERR_NO_SESSION = 5,
  TUIB_ERR_LIMIT = 6,
  TUIB_ERR_INTERNAL = 7
} TuibStatus;

#define TUIB_FEATURE_SCROLLBAR        (1u << 0)
#define TUIB_FEATURE_CANVAS           (1u << 1)
#define TUIB_FEATURE_STYLE_DUMP_EX    (1u << 2)
#define TUIB_FEATURE_BATCH_TABLE_ROWS (1u << 3)
#define TUIB_FEATURE_BATCH_LIST_ITEMS (1u << 4)
#define TUIB_FEATURE_COLOR_HELPERS    (1u << 5)
#define TUIB_FEATURE_AXIS_LABELS      (1u << 6)
#define TUIB_FEATURE_SPAN_SETTERS     (1u << 7)

/* Color encoding: 0 Reset, 1..16 Named, 0x40000000|idx Indexed, 0x80000000|rgb Rgb */
#define TUIB_COLOR_RESET 0u

#define TUIB_MOD_BOLD       (1u << 0)
#define TUIB_MOD_ITALIC     (1u << 1)
#define TUIB_MOD_UNDERLINE  (1u << 2)
#define TUIB_MOD_DIM        (1u << 3)
#define TUIB_MOD_CROSSED    (1u << 4)
#define TUIB_MOD_REVERSED   (1u << 5)
#define TUIB_MOD_RAPIDBLINK (1u << 6)
#define TUIB_MOD_SLOWBLINK  (1u << 7)
#define TUIB_MOD_HIDDEN     (1u << 8)

#define TUIB_BORDER_LEFT   1u
#define TUIB_BORDER_RIGHT  2u
#define TUIB_BORDER_TOP    4u
#define TUIB_BORDER_BOTTOM 8u
#define TUIB_BORDER_ALL    15u

typedef enum TuibWidgetKind {
  TUIB_KIND_PARAGRAPH = 1,
  TUIB_KIND_LIST = 2,
  TUIB_KIND_TABLE = 3,
  TUIB_KIND_GAUGE = 4,
  TUIB_KIND_TABS = 5,
  TUIB_KIND_BARCHART = 6,
  TUIB_KIND_SPARKLINE = 7,
  TUIB_KIND_CHART = 8,
  TUIB_KIND_SCROLLBAR = 9,
  TUIB_KIND_LINEGAUGE = 10,
  TUIB_KIND_CLEAR = 11,
  TUIB_KIND_LOGO = 12,
  TUIB_KIND_CANVAS = 13
} TuibWidgetKind;

/* Constraint kinds; split and split_ex accept only LENGTH, PERCENTAGE and MIN */
#define TUIB_CONSTRAINT_LENGTH     0u
#define TUIB_CONSTRAINT_PERCENTAGE 1u
#define TUIB_CONSTRAINT_MIN        2u
#define TUIB_CONSTRAINT_RATIO      3u
#define TUIB_CONSTRAINT_MAX        4u

#define TUIB_DIRECTION_VERTICAL   0u
#define TUIB_DIRECTION_HORIZONTAL 1u

#define TUIB_SNAPSHOT_HEADLESS 0u
#define TUIB_SNAPSHOT_SESSION  1u

#define TUIB_EVENT_NONE   0u
#define TUIB_EVENT_KEY    1u
#define TUIB_EVENT_RESIZE 2u
#define TUIB_EVENT_MOUSE  3u

#define TUIB_KEYMOD_SHIFT 1u
#define TUIB_KEYMOD_ALT   2u
#define TUIB_KEYMOD_CTRL  4u

typedef struct TuibStyle { uint32_t fg; uint32_t bg; uint16_t mods; } TuibStyle;
typedef struct TuibSpan { const char* text; size_t len; TuibStyle style; } TuibSpan;
typedef struct TuibLine { const TuibSpan* spans; size_t count; } TuibLine;
typedef struct TuibCellLines { const TuibLine* lines; size_t count; } TuibCellLines;
typedef struct TuibRowCells { const TuibCellLines* cells; size_t count; } TuibRowCells;
typedef struct TuibRect { uint16_t x; uint16_t y; uint16_t width; uint16_t height; } TuibRect;
typedef struct TuibDrawCmd { uint32_t kind; uint64_t handle; TuibRect rect; } TuibDrawCmd;
typedef struct TuibCellInfo { uint32_t ch; uint32_t fg; uint32_t bg; uint16_t mods; } TuibCellInfo;
typedef struct TuibConstraint { uint32_t kind; uint32_t a; uint32_t b; } TuibConstraint;
typedef struct TuibPoint { double x; double y; } TuibPoint;

typedef struct TuibBlock {
  uint8_t borders;
  uint32_t border_type; /* 0 Plain, 1 Thick, 2 Double, 3 Rounded, 4 QuadrantInside, 5 QuadrantOutside */
  TuibStyle border_style;
  uint16_t pad_left, pad_top, pad_right, pad_bottom;
  uint32_t title_alignment; /* 0 Left, 1 Center, 2 Right */
} TuibBlock;

typedef struct TuibKeyEvent { uint32_t code; uint32_t ch; uint8_t mods; } TuibKeyEvent;
typedef struct TuibEvent {
  uint32_t kind;
  TuibKeyEvent key;
  uint16_t width;
  uint16_t height;
  uint16_t mouse_x;
  uint16_t mouse_y;
  uint32_t mouse_kind;
  uint32_t mouse_btn;
  uint8_t mouse_mods;
} TuibEvent;

typedef struct TuibConfig {
  bool default_raw;
  bool default_alt_screen;
  bool trace;
  const char* log_path; /* NULL or empty: no log file */
  size_t log_path_len;
  bool log_append;
} TuibConfig;

typedef struct TuibParagraph { uint64_t id; } TuibParagraph;
typedef struct TuibList { uint64_t id; } TuibList;
typedef struct TuibTable { uint64_t id; } TuibTable;
typedef struct TuibGauge { uint64_t id; } TuibGauge;
typedef struct TuibLineGauge { uint64_t id; } TuibLineGauge;
typedef struct TuibTabs { uint64_t id; } TuibTabs;
typedef struct TuibBarChart { uint64_t id; } TuibBarChart;
typedef struct TuibSparkline { uint64_t id; } TuibSparkline;
typedef struct TuibChart { uint64_t id; } TuibChart;
typedef struct TuibScrollbar { uint64_t id; } TuibScrollbar;
typedef struct TuibCanvas { uint64_t id; } TuibCanvas;

/* ---- engine ---- */
void tuib_version(uint32_t* major, uint32_t* minor, uint32_t* patch);
uint32_t tuib_feature_bits(void);
uint32_t tuib_color_rgb(uint8_t r, uint8_t g, uint8_t b);
uint32_t tuib_color_indexed(uint8_t index);
uint32_t tuib_color_named(uint8_t index);
TuibStatus tuib_engine_configure(const TuibConfig* cfg);
/* Required length (without NUL) in *out_len; TUIB_ERR_CAPACITY if cap <= that length. */
TuibStatus tuib_last_error(char* buf, size_t cap, size_t* out_len);
void tuib_clear_last_error(void);
TuibStatus tuib_set_safety(bool enabled);
TuibStatus tuib_set_caps(uint32_t max_width, uint32_t max_height, uint64_t max_area, size_t max_text_len,
                         size_t max_batch);

/* ---- layout ---- */
TuibStatus tuib_layout_split(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                             uint16_t margin_left, uint16_t margin_top, uint16_t margin_right, uint16_t margin_bottom,
                             TuibRect* out, size_t cap, size_t* out_count);
TuibStatus tuib_layout_split_ex(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                                uint16_t spacing, uint16_t margin_left, uint16_t margin_top, uint16_t margin_right,
                                uint16_t margin_bottom, TuibRect* out, size_t cap, size_t* out_count);
TuibStatus tuib_layout_split_ex2(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                                 uint16_t spacing, uint16_t margin_left, uint16_t margin_top, uint16_t margin_right,
                                 uint16_t margin_bottom, TuibRect* out, size_t cap, size_t* out_count);

/* ---- headless rendering and snapshots ---- */
TuibStatus tuib_headless_render(uint16_t width, uint16_t height, const TuibDrawCmd* cmds, size_t n);
TuibStatus tuib_headless_render_text(uint16_t width, uint16_t height, const TuibDrawCmd* cmds, size_t n,
                                     char* buf, size_t cap, size_t* out_len);
TuibStatus tuib_snapshot_text(uint32_t source, char* buf, size_t cap, size_t* out_len);
TuibStatus tuib_snapshot_styles(uint32_t source, char* buf, size_t cap, size_t* out_len);
TuibStatus tuib_snapshot_styles_ex(uint32_t source, char* buf, size_t cap, size_t* out_len);
/* Fills min(cells, cap) records; *out_required is always the total cell count. */
TuibStatus tuib_snapshot_cells(uint32_t source, TuibCellInfo* out, size_t cap, size_t* out_required);

/* ---- terminal session ---- */
TuibStatus tuib_terminal_init(void);
TuibStatus tuib_terminal_init_headless(uint16_t width, uint16_t height, bool interactive);
TuibStatus tuib_terminal_free(void);
TuibStatus tuib_terminal_enable_raw(void);
TuibStatus tuib_terminal_disable_raw(void);
TuibStatus tuib_terminal_enter_alt(void);
TuibStatus tuib_terminal_leave_alt(void);
TuibStatus tuib_terminal_set_cursor(uint16_t x, uint16_t y);
TuibStatus tuib_terminal_get_cursor(uint16_t* x, uint16_t* y);
TuibStatus tuib_terminal_show_cursor(bool visible);
TuibStatus tuib_terminal_size(uint16_t* width, uint16_t* height);
TuibStatus tuib_terminal_clear(void);
TuibStatus tuib_terminal_draw_frame(const TuibDrawCmd* cmds, size_t n);

/* ---- events ---- */
/* Waits up to timeout_ms; out->kind is TUIB_EVENT_NONE when nothing arrived. */
TuibStatus tuib_next_event(uint64_t timeout_ms, TuibEvent* out);
TuibStatus tuib_inject_key(uint32_t code, uint32_t ch, uint8_t mods);
TuibStatus tuib_inject_resize(uint16_t width, uint16_t height);
TuibStatus tuib_inject_mouse(uint32_t kind, uint32_t button, uint16_t x, uint16_t y, uint8_t mods);

/* ---- paragraph ---- */
TuibStatus tuib_paragraph_new(const char* text, size_t len, TuibParagraph* out);
TuibStatus tuib_paragraph_new_empty(TuibParagraph* out);
TuibStatus tuib_paragraph_free(TuibParagraph p);
TuibStatus tuib_paragraph_append_line(TuibParagraph p, const char* text, size_t len, TuibStyle style);
/* spans extend the last line */
TuibStatus tuib_paragraph_append_spans(TuibParagraph p, const TuibSpan* spans, size_t n);
TuibStatus tuib_paragraph_append_line_spans(TuibParagraph p, const TuibSpan* spans, size_t n);
TuibStatus tuib_paragraph_append_lines(TuibParagraph p, const TuibLine* lines, size_t n);
TuibStatus tuib_paragraph_set_alignment(TuibParagraph p, uint32_t alignment);
TuibStatus tuib_paragraph_set_wrap(TuibParagraph p, bool wrap, bool trim);
TuibStatus tuib_paragraph_set_scroll(TuibParagraph p, uint16_t x, uint16_t y);
TuibStatus tuib_paragraph_set_style(TuibParagraph p, TuibStyle style);
TuibStatus tuib_paragraph_reserve_lines(TuibParagraph p, size_t additional);
TuibStatus tuib_paragraph_set_block(TuibParagraph p, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_paragraph_clear_block(TuibParagraph p);

/* ---- list ---- */
TuibStatus tuib_list_new(TuibList* out);
TuibStatus tuib_list_free(TuibList l);
TuibStatus tuib_list_append_item(TuibList l, const char* text, size_t len, TuibStyle style);
TuibStatus tuib_list_append_item_spans(TuibList l, const TuibSpan* spans, size_t n);
TuibStatus tuib_list_append_items(TuibList l, const TuibLine* items, size_t n);
TuibStatus tuib_list_set_selected(TuibList l, int32_t index); /* -1 clears */
TuibStatus tuib_list_set_highlight_style(TuibList l, TuibStyle style);
TuibStatus tuib_list_set_highlight_symbol(TuibList l, const char* text, size_t len);
TuibStatus tuib_list_set_direction(TuibList l, uint32_t direction); /* 0 top-to-bottom, 1 bottom-to-top */
TuibStatus tuib_list_set_scroll_offset(TuibList l, uint32_t offset);
TuibStatus tuib_list_set_highlight_spacing(TuibList l, uint32_t spacing); /* 0 Always, 1 Never, 2 WhenSelected */
TuibStatus tuib_list_set_style(TuibList l, TuibStyle style);
TuibStatus tuib_list_reserve_items(TuibList l, size_t additional);
TuibStatus tuib_list_set_block(TuibList l, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_list_clear_block(TuibList l);

/* ---- table ---- */
TuibStatus tuib_table_new(TuibTable* out);
TuibStatus tuib_table_free(TuibTable t);
/* one span per header cell */
TuibStatus tuib_table_set_header_spans(TuibTable t, const TuibSpan* cells, size_t n);
TuibStatus tuib_table_set_header_style(TuibTable t, TuibStyle style);
/* one span per cell */
TuibStatus tuib_table_append_row_spans(TuibTable t, const TuibSpan* cells, size_t n);
TuibStatus tuib_table_append_row_cells(TuibTable t, const TuibCellLines* cells, size_t n);
TuibStatus tuib_table_append_rows(TuibTable t, const TuibRowCells* rows, size_t n);
TuibStatus tuib_table_set_widths_percent(TuibTable t, const uint16_t* widths, size_t n);
TuibStatus tuib_table_set_column_spacing(TuibTable t, uint16_t spacing);
TuibStatus tuib_table_set_selected(TuibTable t, int32_t row);
TuibStatus tuib_table_set_row_highlight_style(TuibTable t, TuibStyle style);
TuibStatus tuib_table_set_highlight_symbol(TuibTable t, const char* text, size_t len);
TuibStatus tuib_table_set_row_height(TuibTable t, uint16_t height);
TuibStatus tuib_table_set_highlight_spacing(TuibTable t, uint32_t spacing);
TuibStatus tuib_table_set_style(TuibTable t, TuibStyle style);
TuibStatus tuib_table_reserve_rows(TuibTable t, size_t additional);
TuibStatus tuib_table_set_block(TuibTable t, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_table_clear_block(TuibTable t);

/* ---- gauge: label is a single run under the first span's style ---- */
TuibStatus tuib_gauge_new(TuibGauge* out);
TuibStatus tuib_gauge_free(TuibGauge g);
TuibStatus tuib_gauge_set_ratio(TuibGauge g, float ratio);
TuibStatus tuib_gauge_set_label(TuibGauge g, const char* text, size_t len, TuibStyle style);
TuibStatus tuib_gauge_set_label_spans(TuibGauge g, const TuibSpan* spans, size_t n);
TuibStatus tuib_gauge_set_styles(TuibGauge g, TuibStyle style, TuibStyle gauge_style);
TuibStatus tuib_gauge_set_block(TuibGauge g, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_gauge_clear_block(TuibGauge g);

/* ---- line gauge: label spans keep their own styles ---- */
TuibStatus tuib_linegauge_new(TuibLineGauge* out);
TuibStatus tuib_linegauge_free(TuibLineGauge g);
TuibStatus tuib_linegauge_set_ratio(TuibLineGauge g, float ratio);
TuibStatus tuib_linegauge_set_label(TuibLineGauge g, const char* text, size_t len, TuibStyle style);
TuibStatus tuib_linegauge_set_label_spans(TuibLineGauge g, const TuibSpan* spans, size_t n);
TuibStatus tuib_linegauge_set_styles(TuibLineGauge g, TuibStyle style, TuibStyle filled, TuibStyle unfilled);
TuibStatus tuib_linegauge_set_block(TuibLineGauge g, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_linegauge_clear_block(TuibLineGauge g);

/* ---- tabs ---- */
TuibStatus tuib_tabs_new(TuibTabs* out);
TuibStatus tuib_tabs_free(TuibTabs t);
TuibStatus tuib_tabs_append_title(TuibTabs t, const char* text, size_t len, TuibStyle style);
TuibStatus tuib_tabs_append_title_spans(TuibTabs t, const TuibSpan* spans, size_t n);
TuibStatus tuib_tabs_set_selected(TuibTabs t, uint32_t index);
TuibStatus tuib_tabs_set_styles(TuibTabs t, TuibStyle unselected, TuibStyle selected);
TuibStatus tuib_tabs_set_divider(TuibTabs t, const char* text, size_t len, TuibStyle style);
/* one span: kept as is; several: joined under the first span's style; none: no divider */
TuibStatus tuib_tabs_set_divider_spans(TuibTabs t, const TuibSpan* spans, size_t n);
TuibStatus tuib_tabs_reserve_titles(TuibTabs t, size_t additional);
TuibStatus tuib_tabs_set_block(TuibTabs t, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_tabs_clear_block(TuibTabs t);

/* ---- bar chart ---- */
TuibStatus tuib_barchart_new(TuibBarChart* out);
TuibStatus tuib_barchart_free(TuibBarChart c);
TuibStatus tuib_barchart_set_values(TuibBarChart c, const uint64_t* values, size_t n);
TuibStatus tuib_barchart_append_bar(TuibBarChart c, uint64_t value, const char* label, size_t len);
/* each line becomes one single-run label */
TuibStatus tuib_barchart_set_labels_spans(TuibBarChart c, const TuibLine* labels, size_t n);
TuibStatus tuib_barchart_set_bar_width(TuibBarChart c, uint16_t width);
TuibStatus tuib_barchart_set_bar_gap(TuibBarChart c, uint16_t gap);
TuibStatus tuib_barchart_set_styles(TuibBarChart c, TuibStyle bar, TuibStyle value, TuibStyle label);
TuibStatus tuib_barchart_reserve_bars(TuibBarChart c, size_t additional);
TuibStatus tuib_barchart_set_block(TuibBarChart c, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_barchart_clear_block(TuibBarChart c);

/* ---- sparkline ---- */
TuibStatus tuib_sparkline_new(TuibSparkline* out);
TuibStatus tuib_sparkline_free(TuibSparkline s);
TuibStatus tuib_sparkline_set_values(TuibSparkline s, const uint64_t* values, size_t n);
TuibStatus tuib_sparkline_append_value(TuibSparkline s, uint64_t value);
TuibStatus tuib_sparkline_set_max(TuibSparkline s, uint64_t max); /* 0: automatic */
TuibStatus tuib_sparkline_set_style(TuibSparkline s, TuibStyle style);
TuibStatus tuib_sparkline_reserve_values(TuibSparkline s, size_t additional);
TuibStatus tuib_sparkline_set_block(TuibSparkline s, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_sparkline_clear_block(TuibSparkline s);

/* ---- chart ---- */
#define TUIB_AXIS_X 0u
#define TUIB_AXIS_Y 1u
TuibStatus tuib_chart_new(TuibChart* out);
TuibStatus tuib_chart_free(TuibChart c);
/* graph_type: 0 Line, 1 Bar, 2 Scatter */
TuibStatus tuib_chart_add_dataset(TuibChart c, const char* name, size_t len, const TuibPoint* points, size_t n,
                                  TuibStyle style, uint32_t graph_type, size_t* out_index);
TuibStatus tuib_chart_append_points(TuibChart c, size_t dataset, const TuibPoint* points, size_t n);
TuibStatus tuib_chart_reserve_datasets(TuibChart c, size_t additional);
TuibStatus tuib_chart_reserve_points(TuibChart c, size_t dataset, size_t additional);
TuibStatus tuib_chart_set_axis(TuibChart c, uint32_t axis, const char* title, size_t len, double min, double max,
                               TuibStyle style);
/* one span per label */
TuibStatus tuib_chart_set_axis_labels_spans(TuibChart c, uint32_t axis, const TuibSpan* labels, size_t n);
TuibStatus tuib_chart_set_legend_position(TuibChart c, uint32_t position); /* 0 TR, 1 TL, 2 BR, 3 BL, 4 none */
TuibStatus tuib_chart_set_style(TuibChart c, TuibStyle style);
TuibStatus tuib_chart_set_block(TuibChart c, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_chart_clear_block(TuibChart c);

/* ---- scrollbar (side: 0 vertical-left, 1 vertical-right, 2 horizontal-top, 3 horizontal-bottom) ---- */
TuibStatus tuib_scrollbar_new(uint32_t side, TuibScrollbar* out);
TuibStatus tuib_scrollbar_free(TuibScrollbar s);
TuibStatus tuib_scrollbar_configure(TuibScrollbar s, uint32_t side, uint32_t content_length, uint32_t position,
                                    uint32_t viewport_length);
TuibStatus tuib_scrollbar_set_styles(TuibScrollbar s, TuibStyle thumb, TuibStyle track);

/* ---- canvas (marker: 0 Dot, 1 Block, 2 Bar, 3 Braille, 4 HalfBlock) ---- */
TuibStatus tuib_canvas_new(double x_min, double x_max, double y_min, double y_max, TuibCanvas* out);
TuibStatus tuib_canvas_free(TuibCanvas c);
TuibStatus tuib_canvas_set_bounds(TuibCanvas c, double x_min, double x_max, double y_min, double y_max);
TuibStatus tuib_canvas_set_background(TuibCanvas c, uint32_t color);
TuibStatus tuib_canvas_set_marker(TuibCanvas c, uint32_t marker);
TuibStatus tuib_canvas_add_line(TuibCanvas c, double x1, double y1, double x2, double y2, TuibStyle style);
TuibStatus tuib_canvas_add_rect(TuibCanvas c, double x, double y, double w, double h, TuibStyle style);
TuibStatus tuib_canvas_add_points(TuibCanvas c, const TuibPoint* points, size_t n, TuibStyle style);
TuibStatus tuib_canvas_reserve_shapes(TuibCanvas c, size_t additional);
TuibStatus tuib_canvas_set_block(TuibCanvas c, const TuibBlock* block, const TuibSpan* title, size_t n);
TuibStatus tuib_canvas_clear_block(TuibCanvas c);

#ifdef __cplusplus
}
#endif
