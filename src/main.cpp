#include "tuibridge.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// Demo host: the environment is read here and passed to the engine explicitly.
static bool env_flag(const char* name, bool dflt) {
  const char* v = std::getenv(name);
  if (!v || !*v) return dflt;
  return !(std::strcmp(v, "0") == 0 || std::strcmp(v, "false") == 0 || std::strcmp(v, "no") == 0);
}

static void report(const char* what, TuibStatus st) {
  if (st == TUIB_OK) return;
  char msg[256];
  size_t len = 0;
  if (tuib_last_error(msg, sizeof msg, &len) != TUIB_OK) msg[0] = '\0';
  std::fprintf(stderr, "%s failed (%d): %s\n", what, static_cast<int>(st), msg);
}

struct Demo {
  TuibParagraph help{};
  TuibList menu{};
  TuibGauge progress{};
  TuibTabs tabs{};
  TuibSparkline spark{};
  int selected = 0;
  uint64_t ticks = 0;
};

static const char* kItems[] = {"Paragraph", "List", "Gauge", "Tabs", "Sparkline"};

static bool build(Demo& d) {
  const TuibStyle plain{0, 0, 0};
  const TuibStyle accent{tuib_color_named(7), 0, TUIB_MOD_BOLD};
  TuibBlock frame{};
  frame.borders = TUIB_BORDER_ALL;
  frame.border_type = 3;

  const char* help = "tuibridge demo\nUp/Down: select  q/Esc: quit";
  if (tuib_paragraph_new(help, std::strlen(help), &d.help) != TUIB_OK) return false;
  TuibSpan help_title{"help", 4, accent};
  if (tuib_paragraph_set_block(d.help, &frame, &help_title, 1) != TUIB_OK) return false;

  if (tuib_list_new(&d.menu) != TUIB_OK) return false;
  for (const char* item : kItems)
    if (tuib_list_append_item(d.menu, item, std::strlen(item), plain) != TUIB_OK) return false;
  if (tuib_list_set_highlight_symbol(d.menu, "> ", 2) != TUIB_OK) return false;
  if (tuib_list_set_highlight_style(d.menu, TuibStyle{0, 0, TUIB_MOD_REVERSED}) != TUIB_OK) return false;
  if (tuib_list_set_block(d.menu, &frame, nullptr, 0) != TUIB_OK) return false;

  if (tuib_gauge_new(&d.progress) != TUIB_OK) return false;
  if (tuib_gauge_set_styles(d.progress, plain, TuibStyle{tuib_color_named(3), 0, 0}) != TUIB_OK) return false;

  if (tuib_tabs_new(&d.tabs) != TUIB_OK) return false;
  for (const char* t : {"one", "two", "three"})
    if (tuib_tabs_append_title(d.tabs, t, std::strlen(t), plain) != TUIB_OK) return false;
  if (tuib_tabs_set_styles(d.tabs, plain, accent) != TUIB_OK) return false;

  if (tuib_sparkline_new(&d.spark) != TUIB_OK) return false;
  return true;
}

static void teardown(Demo& d) {
  report("free paragraph", tuib_paragraph_free(d.help));
  report("free list", tuib_list_free(d.menu));
  report("free gauge", tuib_gauge_free(d.progress));
  report("free tabs", tuib_tabs_free(d.tabs));
  report("free sparkline", tuib_sparkline_free(d.spark));
}

static TuibStatus draw(Demo& d) {
  uint16_t w = 0, h = 0;
  TuibStatus st = tuib_terminal_size(&w, &h);
  if (st != TUIB_OK) return st;

  TuibConstraint rows[] = {{TUIB_CONSTRAINT_LENGTH, 1, 0}, {TUIB_CONSTRAINT_MIN, 3, 0}, {TUIB_CONSTRAINT_LENGTH, 3, 0}};
  TuibRect r[3];
  size_t count = 0;
  st = tuib_layout_split_ex2(TuibRect{0, 0, w, h}, TUIB_DIRECTION_VERTICAL, rows, 3, 0, 0, 0, 0, 0, r, 3, &count);
  if (st != TUIB_OK) return st;

  TuibConstraint cols[] = {{TUIB_CONSTRAINT_RATIO, 1, 3}, {TUIB_CONSTRAINT_RATIO, 2, 3}};
  TuibRect c[2];
  st = tuib_layout_split_ex2(r[1], TUIB_DIRECTION_HORIZONTAL, cols, 2, 1, 0, 0, 0, 0, c, 2, &count);
  if (st != TUIB_OK) return st;

  st = tuib_list_set_selected(d.menu, d.selected);
  if (st != TUIB_OK) return st;
  st = tuib_tabs_set_selected(d.tabs, static_cast<uint32_t>(d.ticks % 3));
  if (st != TUIB_OK) return st;
  st = tuib_gauge_set_ratio(d.progress, static_cast<float>(d.ticks % 101) / 100.0f);
  if (st != TUIB_OK) return st;
  st = tuib_sparkline_append_value(d.spark, (d.ticks * 7) % 13);
  if (st != TUIB_OK) return st;

  const bool spark = d.selected == 4;
  const uint32_t detail_kind = spark ? TUIB_KIND_SPARKLINE : TUIB_KIND_PARAGRAPH;
  TuibDrawCmd cmds[] = {
    {TUIB_KIND_CLEAR, 0, TuibRect{0, 0, w, h}},
    {TUIB_KIND_TABS, d.tabs.id, r[0]},
    {TUIB_KIND_LIST, d.menu.id, c[0]},
    {detail_kind, spark ? d.spark.id : d.help.id, c[1]},
    {TUIB_KIND_GAUGE, d.progress.id, r[2]},
  };
  return tuib_terminal_draw_frame(cmds, sizeof cmds / sizeof cmds[0]);
}

int main() {
  const char* log_path = std::getenv("TUIB_LOG");
  TuibConfig cfg{};
  cfg.default_raw = !env_flag("TUIB_NO_RAW", false);
  cfg.default_alt_screen = env_flag("TUIB_ALTSCR", true);
  cfg.trace = env_flag("TUIB_TRACE", false);
  cfg.log_path = log_path;
  cfg.log_path_len = log_path ? std::strlen(log_path) : 0;
  cfg.log_append = env_flag("TUIB_LOG_APPEND", false);

  TuibStatus st = tuib_engine_configure(&cfg);
  if (st != TUIB_OK) { report("configure", st); return 1; }
  st = tuib_terminal_init();
  if (st != TUIB_OK) { report("terminal init", st); return 1; }

  Demo d;
  if (!build(d)) {
    report("build widgets", TUIB_ERR_INTERNAL);
    report("terminal free", tuib_terminal_free());
    return 1;
  }

  bool running = true;
  while (running) {
    st = draw(d);
    if (st != TUIB_OK) { report("draw", st); break; }
    TuibEvent ev{};
    st = tuib_next_event(100, &ev);
    if (st != TUIB_OK) { report("next event", st); break; }
    ++d.ticks;
    if (ev.kind != TUIB_EVENT_KEY) continue;
    if (ev.key.code == 6 || (ev.key.code == 0 && ev.key.ch == 'q')) running = false;
    else if (ev.key.code == 4 && d.selected > 0) --d.selected;
    else if (ev.key.code == 5 && d.selected < 4) ++d.selected;
  }

  teardown(d);
  report("terminal free", tuib_terminal_free());
  return 0;
}
