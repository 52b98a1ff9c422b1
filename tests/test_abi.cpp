#include "tuibridge.h"
#include <cassert>
#include <cmath>
#include <cstring>
#include <string>
#include <vector>

static const TuibStyle kPlain{0, 0, 0};

static std::string last_error() {
  char buf[512];
  size_t len = 0;
  assert(tuib_last_error(buf, sizeof buf, &len) == TUIB_OK);
  return std::string(buf, len);
}

static std::string headless_text() {
  char buf[1024];
  size_t len = 0;
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_HEADLESS, buf, sizeof buf, &len) == TUIB_OK);
  return std::string(buf, len);
}

static void version_and_features() {
  uint32_t major = 9, minor = 9, patch = 9;
  tuib_version(&major, &minor, &patch);
  assert(major == 0 && minor == 3 && patch == 0);
  const uint32_t bits = tuib_feature_bits();
  assert(bits & TUIB_FEATURE_SPAN_SETTERS);
  assert(bits & TUIB_FEATURE_STYLE_DUMP_EX);
  assert(tuib_color_rgb(1, 2, 3) == 0x80010203u);
  assert(tuib_color_indexed(42) == 0x4000002Au);
  assert(tuib_color_named(0) == 1);
}

static void hello_snapshot_and_capacity() {
  TuibParagraph p{};
  assert(tuib_paragraph_new("Hello", 5, &p) == TUIB_OK);
  assert(p.id != 0);
  TuibDrawCmd cmd{TUIB_KIND_PARAGRAPH, p.id, TuibRect{0, 0, 5, 1}};

  char buf[6];
  size_t len = 0;
  assert(tuib_headless_render_text(5, 1, &cmd, 1, buf, sizeof buf, &len) == TUIB_OK);
  assert(len == 5);
  assert(std::strcmp(buf, "Hello") == 0);

  // exactly the text length leaves no room for the terminator
  char small[5] = {'x', 'x', 'x', 'x', 'x'};
  len = 0;
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_HEADLESS, small, sizeof small, &len) == TUIB_ERR_CAPACITY);
  assert(len == 5);
  assert(small[0] == '\0');
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_HEADLESS, nullptr, 0, &len) == TUIB_ERR_CAPACITY && len == 5);

  char styles[64];
  assert(tuib_snapshot_styles(TUIB_SNAPSHOT_HEADLESS, styles, sizeof styles, &len) == TUIB_OK);
  assert(std::string(styles) == "00000000 00000000 00000000 00000000 00000000");

  TuibCellInfo cells[2];
  size_t required = 0;
  assert(tuib_snapshot_cells(TUIB_SNAPSHOT_HEADLESS, cells, 2, &required) == TUIB_ERR_CAPACITY);
  assert(required == 5);
  assert(cells[0].ch == 'H' && cells[1].ch == 'e');
  TuibCellInfo all[5];
  assert(tuib_snapshot_cells(TUIB_SNAPSHOT_HEADLESS, all, 5, &required) == TUIB_OK);
  assert(all[4].ch == 'o');

  assert(tuib_snapshot_text(7, buf, sizeof buf, &len) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_paragraph_free(p) == TUIB_OK);
}

static void tabs_divider_spans() {
  const TuibStyle red{tuib_color_named(1), 0, 0};
  const TuibStyle blue_bold{0, tuib_color_named(4), TUIB_MOD_BOLD};
  TuibTabs t{};
  assert(tuib_tabs_new(&t) == TUIB_OK);
  assert(tuib_tabs_append_title(t, "A", 1, kPlain) == TUIB_OK);
  assert(tuib_tabs_append_title(t, "B", 1, kPlain) == TUIB_OK);
  TuibSpan divider[] = {{"|", 1, red}, {"-", 1, blue_bold}};
  assert(tuib_tabs_set_divider_spans(t, divider, 2) == TUIB_OK);

  TuibDrawCmd cmd{TUIB_KIND_TABS, t.id, TuibRect{0, 0, 8, 1}};
  assert(tuib_headless_render(8, 1, &cmd, 1) == TUIB_OK);
  assert(headless_text() == " A |- B ");

  char ex[256];
  size_t len = 0;
  assert(tuib_snapshot_styles_ex(TUIB_SNAPSHOT_HEADLESS, ex, sizeof ex, &len) == TUIB_OK);
  const std::string s(ex, len);
  assert(s.substr(3 * 21, 20) == "00000002000000000000");
  assert(s.substr(4 * 21, 20) == "00000002000000000000");

  // no spans: divider removed
  assert(tuib_tabs_set_divider_spans(t, nullptr, 0) == TUIB_OK);
  assert(tuib_headless_render(8, 1, &cmd, 1) == TUIB_OK);
  assert(headless_text() == " A  B   ");
  assert(tuib_tabs_free(t) == TUIB_OK);
}

static void handle_safety() {
  TuibParagraph p{};
  assert(tuib_paragraph_new("keep", 4, &p) == TUIB_OK);
  TuibDrawCmd good{TUIB_KIND_PARAGRAPH, p.id, TuibRect{0, 0, 4, 1}};
  assert(tuib_headless_render(4, 1, &good, 1) == TUIB_OK);

  // a list handle carrying a paragraph id is rejected without mutation
  TuibList wrong{p.id};
  assert(tuib_list_set_selected(wrong, 0) == TUIB_ERR_INVALID_HANDLE);
  assert(!last_error().empty());
  tuib_clear_last_error();
  assert(last_error().empty());

  TuibDrawCmd bad_kind{99, p.id, TuibRect{0, 0, 4, 1}};
  assert(tuib_headless_render(4, 1, &bad_kind, 1) == TUIB_ERR_INVALID_ARGUMENT);
  TuibDrawCmd mismatched{TUIB_KIND_LIST, p.id, TuibRect{0, 0, 4, 1}};
  assert(tuib_headless_render(4, 1, &mismatched, 1) == TUIB_ERR_INVALID_HANDLE);
  assert(headless_text() == "keep");

  const uint64_t old_id = p.id;
  assert(tuib_paragraph_free(p) == TUIB_OK);
  assert(tuib_paragraph_free(p) == TUIB_ERR_INVALID_HANDLE);
  assert(tuib_paragraph_set_wrap(p, true, true) == TUIB_ERR_INVALID_HANDLE);
  assert(tuib_headless_render(4, 1, &good, 1) == TUIB_ERR_INVALID_HANDLE);
  assert(headless_text() == "keep");

  // the slot comes back under a new generation
  TuibParagraph q{};
  assert(tuib_paragraph_new_empty(&q) == TUIB_OK);
  assert(q.id != old_id);
  assert((q.id & 0xFFFFFFFFu) == (old_id & 0xFFFFFFFFu));
  assert(tuib_paragraph_set_wrap(TuibParagraph{old_id}, true, true) == TUIB_ERR_INVALID_HANDLE);
  assert(tuib_paragraph_free(q) == TUIB_OK);

  assert(tuib_paragraph_free(TuibParagraph{0}) == TUIB_ERR_INVALID_HANDLE);
  assert(tuib_paragraph_new("x", 1, nullptr) == TUIB_ERR_INVALID_ARGUMENT);
}

static void failed_setters_keep_state() {
  TuibList l{};
  assert(tuib_list_new(&l) == TUIB_OK);
  assert(tuib_list_append_item(l, "one", 3, kPlain) == TUIB_OK);
  assert(tuib_list_set_direction(l, 5) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_list_set_highlight_spacing(l, 9) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_list_append_item(l, nullptr, 3, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  TuibSpan broken[] = {{"two", 3, kPlain}, {nullptr, 2, kPlain}};
  assert(tuib_list_append_item_spans(l, broken, 2) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_list_reserve_items(l, 64) == TUIB_OK);

  TuibDrawCmd cmd{TUIB_KIND_LIST, l.id, TuibRect{0, 0, 5, 2}};
  assert(tuib_headless_render(5, 2, &cmd, 1) == TUIB_OK);
  assert(headless_text() == "one  \n     ");
  assert(tuib_list_free(l) == TUIB_OK);

  TuibGauge g{};
  assert(tuib_gauge_new(&g) == TUIB_OK);
  assert(tuib_gauge_set_ratio(g, NAN) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_gauge_set_ratio(g, 2.0f) == TUIB_OK);
  TuibDrawCmd gc{TUIB_KIND_GAUGE, g.id, TuibRect{0, 0, 6, 1}};
  assert(tuib_headless_render(6, 1, &gc, 1) == TUIB_OK);
  assert(headless_text().find("100%") != std::string::npos);
  assert(tuib_gauge_free(g) == TUIB_OK);

  TuibChart c{};
  assert(tuib_chart_new(&c) == TUIB_OK);
  TuibPoint pts[] = {{0, 0}, {1, 1}};
  size_t index = 99;
  assert(tuib_chart_add_dataset(c, "s", 1, pts, 2, kPlain, 2, &index) == TUIB_OK);
  assert(index == 0);
  assert(tuib_chart_append_points(c, 1, pts, 2) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_chart_add_dataset(c, "s", 1, pts, 2, kPlain, 7, &index) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_chart_set_axis(c, TUIB_AXIS_X, "x", 1, 1.0, 0.0, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_chart_free(c) == TUIB_OK);
}

static void malformed_text() {
  TuibParagraph p{};
  assert(tuib_paragraph_new("a\xFF" "b", 3, &p) == TUIB_OK);
  TuibDrawCmd cmd{TUIB_KIND_PARAGRAPH, p.id, TuibRect{0, 0, 3, 1}};
  assert(tuib_headless_render(3, 1, &cmd, 1) == TUIB_OK);
  assert(headless_text() == "a\xEF\xBF\xBD" "b");
  assert(tuib_paragraph_free(p) == TUIB_OK);
}

static void canvas_far_lines() {
  if (!(tuib_feature_bits() & TUIB_FEATURE_CANVAS)) return;
  TuibCanvas c{};
  assert(tuib_canvas_new(0.0, 1.0, 0.0, 1.0, &c) == TUIB_OK);
  assert(tuib_canvas_set_marker(c, 1) == TUIB_OK);
  assert(tuib_canvas_add_line(c, 0.0, NAN, 1.0, 0.5, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_canvas_add_line(c, 0.0, 0.5, INFINITY, 0.5, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_canvas_add_rect(c, -INFINITY, 0.0, 1.0, 1.0, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_canvas_add_rect(c, 0.0, 0.0, -1.0, 1.0, kPlain) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_canvas_add_line(c, 0.0, 0.5, 1.1e8, 0.5, kPlain) == TUIB_OK);
  assert(tuib_canvas_add_line(c, -1e300, 0.5, 1e300, 0.5, kPlain) == TUIB_OK);

  TuibDrawCmd cmd{TUIB_KIND_CANVAS, c.id, TuibRect{0, 0, 10, 4}};
  assert(tuib_headless_render(10, 4, &cmd, 1) == TUIB_OK);
  std::string bar;
  for (int i = 0; i < 10; ++i) bar += "\xE2\x96\x88";
  const std::string blank(10, ' ');
  assert(headless_text() == blank + "\n" + blank + "\n" + bar + "\n" + blank);
  assert(tuib_canvas_free(c) == TUIB_OK);
}

static void safety_caps() {
  assert(tuib_set_caps(10, 10, 50, 4, 2) == TUIB_OK);
  TuibParagraph p{};
  // caps are inert until safety mode is on
  assert(tuib_paragraph_new("hello", 5, &p) == TUIB_OK);
  assert(tuib_set_safety(true) == TUIB_OK);

  TuibParagraph q{};
  assert(tuib_paragraph_new("hello", 5, &q) == TUIB_ERR_LIMIT);
  assert(tuib_headless_render(20, 1, nullptr, 0) == TUIB_ERR_LIMIT);
  assert(tuib_headless_render(10, 6, nullptr, 0) == TUIB_ERR_LIMIT);
  TuibDrawCmd cmds[3] = {{TUIB_KIND_CLEAR, 0, TuibRect{0, 0, 1, 1}}, {TUIB_KIND_CLEAR, 0, TuibRect{0, 0, 1, 1}},
                         {TUIB_KIND_CLEAR, 0, TuibRect{0, 0, 1, 1}}};
  assert(tuib_headless_render(5, 1, cmds, 3) == TUIB_ERR_LIMIT);
  assert(last_error().find("cap") != std::string::npos);
  assert(tuib_headless_render(5, 1, cmds, 2) == TUIB_OK);

  assert(tuib_set_safety(false) == TUIB_OK);
  assert(tuib_headless_render(20, 1, cmds, 3) == TUIB_OK);
  assert(tuib_paragraph_free(p) == TUIB_OK);
  assert(tuib_set_caps(400, 200, 4000000, 8192, 100000) == TUIB_OK);
}

static void layout_capacity() {
  TuibConstraint cons[] = {{TUIB_CONSTRAINT_LENGTH, 2, 0}, {TUIB_CONSTRAINT_MIN, 0, 0}};
  size_t count = 0;
  assert(tuib_layout_split_ex2(TuibRect{0, 0, 10, 4}, TUIB_DIRECTION_VERTICAL, cons, 2, 0, 0, 0, 0, 0, nullptr, 0,
                               &count) == TUIB_ERR_CAPACITY);
  assert(count == 2);
}

static void session_and_events() {
  uint16_t w = 0, h = 0;
  assert(tuib_terminal_size(&w, &h) == TUIB_ERR_NO_SESSION);
  assert(tuib_terminal_free() == TUIB_ERR_NO_SESSION);
  char buf[256];
  size_t len = 0;
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_SESSION, buf, sizeof buf, &len) == TUIB_ERR_NO_SESSION);

  assert(tuib_terminal_init_headless(10, 2, false) == TUIB_OK);
  assert(tuib_terminal_init_headless(10, 2, false) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_terminal_enable_raw() == TUIB_ERR_TERMINAL_UNAVAILABLE);
  assert(tuib_terminal_enter_alt() == TUIB_ERR_TERMINAL_UNAVAILABLE);
  assert(tuib_terminal_disable_raw() == TUIB_OK);
  assert(tuib_terminal_size(&w, &h) == TUIB_OK && w == 10 && h == 2);

  TuibParagraph p{};
  assert(tuib_paragraph_new("Hello", 5, &p) == TUIB_OK);
  TuibDrawCmd cmd{TUIB_KIND_PARAGRAPH, p.id, TuibRect{0, 0, 10, 2}};
  assert(tuib_terminal_draw_frame(&cmd, 1) == TUIB_OK);
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_SESSION, buf, sizeof buf, &len) == TUIB_OK);
  assert(std::string(buf, len) == "Hello     \n          ");

  assert(tuib_terminal_set_cursor(40, 1) == TUIB_OK);
  uint16_t cx = 0, cy = 0;
  assert(tuib_terminal_get_cursor(&cx, &cy) == TUIB_OK && cx == 9 && cy == 1);
  assert(tuib_terminal_show_cursor(false) == TUIB_OK);

  assert(tuib_inject_key(0, 'q', TUIB_KEYMOD_CTRL) == TUIB_OK);
  assert(tuib_inject_mouse(1, 1, 3, 1, 0) == TUIB_OK);
  assert(tuib_inject_resize(6, 3) == TUIB_OK);
  assert(tuib_inject_key(55, 0, 0) == TUIB_ERR_INVALID_ARGUMENT);
  assert(tuib_inject_mouse(0, 1, 0, 0, 0) == TUIB_ERR_INVALID_ARGUMENT);

  TuibEvent ev{};
  assert(tuib_next_event(0, &ev) == TUIB_OK);
  assert(ev.kind == TUIB_EVENT_KEY && ev.key.ch == 'q' && ev.key.mods == TUIB_KEYMOD_CTRL);
  assert(tuib_next_event(0, &ev) == TUIB_OK);
  assert(ev.kind == TUIB_EVENT_MOUSE && ev.mouse_x == 3 && ev.mouse_y == 1 && ev.mouse_btn == 1);
  assert(tuib_next_event(0, &ev) == TUIB_OK);
  assert(ev.kind == TUIB_EVENT_RESIZE && ev.width == 6 && ev.height == 3);
  assert(tuib_terminal_size(&w, &h) == TUIB_OK && w == 6 && h == 3);
  assert(tuib_terminal_get_cursor(&cx, &cy) == TUIB_OK && cx == 5 && cy == 1);

  assert(tuib_next_event(20, &ev) == TUIB_OK);
  assert(ev.kind == TUIB_EVENT_NONE);
  assert(tuib_next_event(0, nullptr) == TUIB_ERR_INVALID_ARGUMENT);

  assert(tuib_terminal_draw_frame(&cmd, 1) == TUIB_OK);
  assert(tuib_snapshot_text(TUIB_SNAPSHOT_SESSION, buf, sizeof buf, &len) == TUIB_OK);
  assert(std::string(buf, len) == "Hello \n      \n      ");

  assert(tuib_paragraph_free(p) == TUIB_OK);
  assert(tuib_terminal_draw_frame(&cmd, 1) == TUIB_ERR_INVALID_HANDLE);
  assert(tuib_terminal_clear() == TUIB_OK);
  assert(tuib_terminal_free() == TUIB_OK);
  assert(tuib_terminal_free() == TUIB_ERR_NO_SESSION);
}

static void configuration() {
  TuibConfig cfg{};
  cfg.default_raw = false;
  cfg.trace = true;
  assert(tuib_engine_configure(&cfg) == TUIB_OK);
  assert(tuib_engine_configure(nullptr) == TUIB_ERR_INVALID_ARGUMENT);

  const char* bad = "/dev/null/tuibridge.log";
  cfg.log_path = bad;
  cfg.log_path_len = std::strlen(bad);
  assert(tuib_engine_configure(&cfg) == TUIB_ERR_INVALID_ARGUMENT);

  cfg = TuibConfig{};
  assert(tuib_engine_configure(&cfg) == TUIB_OK);
}

int main() {
  version_and_features();
  configuration();
  hello_snapshot_and_capacity();
  tabs_divider_spans();
  handle_safety();
  failed_setters_keep_state();
  malformed_text();
  canvas_far_lines();
  safety_caps();
  layout_capacity();
  session_and_events();
  return 0;
}
