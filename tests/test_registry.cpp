#include "engine.hpp"
#include "registry.hpp"
#include "tuibridge.h"
#include <cassert>
#include <set>
#include <utility>

static void slots_and_generations() {
  Registry reg;
  assert(reg.live_count() == 0);
  assert(!reg.find(NULL_WIDGET_ID));

  WidgetId p = reg.create(ParagraphState{});
  WidgetId l = reg.create(ListState{});
  assert(p != NULL_WIDGET_ID && l != NULL_WIDGET_ID && p != l);
  assert(p == ((WidgetId{1} << 32) | 1));
  assert(reg.live_count() == 2);
  assert(reg.contains(p, WidgetKind::Paragraph));
  assert(!reg.contains(p, WidgetKind::List));
  assert(reg.kind(l) == WidgetKind::List);

  reg.get<ParagraphState>(p)->scroll_y = 4;
  assert(reg.get<ParagraphState>(p)->scroll_y == 4);
  assert(reg.get<ListState>(p) == nullptr);

  // a kind mismatch frees nothing
  assert(!reg.free(p, WidgetKind::Gauge));
  assert(reg.live_count() == 2);

  assert(reg.free(p, WidgetKind::Paragraph));
  assert(!reg.free(p, WidgetKind::Paragraph));
  assert(reg.get<ParagraphState>(p) == nullptr);
  assert(!reg.kind(p));

  // the slot is reused under a new generation; the old id stays dead
  WidgetId g = reg.create(GaugeState{});
  assert((g & 0xFFFFFFFFu) == (p & 0xFFFFFFFFu));
  assert((g >> 32) == 2);
  assert(g != p);
  assert(!reg.contains(p, WidgetKind::Gauge));
  assert(reg.contains(g, WidgetKind::Gauge));
  assert(reg.slot_count() == 2);

  // ids from outside the table never resolve
  assert(!reg.find((WidgetId{1} << 32) | 99));
  assert(!reg.find(g & 0xFFFFFFFF00000000ull));

  std::set<WidgetId> seen{l, g};
  for (int i = 0; i < 64; ++i) {
    WidgetId id = reg.create(SparklineState{});
    assert(seen.insert(id).second);
    assert(reg.free(id, WidgetKind::Sparkline));
  }
  assert(reg.live_count() == 2);
}

template <class V>
static std::pair<const void*, size_t> storage(const V& v) { return {v.data(), v.capacity()}; }

// after reserve(n), n appends keep the same allocation
static void reserve_presizes_storage() {
  constexpr size_t N = 32;
  const TuibStyle plain{0, 0, 0};
  Registry& reg = Engine::instance().registry();

  TuibParagraph p{};
  assert(tuib_paragraph_new_empty(&p) == TUIB_OK);
  assert(tuib_paragraph_reserve_lines(p, N) == TUIB_OK);
  const auto& lines = reg.get<ParagraphState>(p.id)->lines;
  const size_t lines_before = lines.size();
  auto st = storage(lines);
  assert(st.second >= lines_before + N);
  for (size_t i = 0; i < N; ++i) assert(tuib_paragraph_append_line(p, "x", 1, plain) == TUIB_OK);
  assert(lines.size() == lines_before + N && storage(lines) == st);
  assert(tuib_paragraph_free(p) == TUIB_OK);

  TuibList l{};
  assert(tuib_list_new(&l) == TUIB_OK);
  assert(tuib_list_reserve_items(l, N) == TUIB_OK);
  const auto& items = reg.get<ListState>(l.id)->items;
  st = storage(items);
  for (size_t i = 0; i < N; ++i) assert(tuib_list_append_item(l, "x", 1, plain) == TUIB_OK);
  assert(items.size() == N && storage(items) == st);
  assert(tuib_list_free(l) == TUIB_OK);

  TuibTable t{};
  assert(tuib_table_new(&t) == TUIB_OK);
  assert(tuib_table_reserve_rows(t, N) == TUIB_OK);
  const auto& rows = reg.get<TableState>(t.id)->rows;
  st = storage(rows);
  const TuibSpan cell{"c", 1, plain};
  for (size_t i = 0; i < N; ++i) assert(tuib_table_append_row_spans(t, &cell, 1) == TUIB_OK);
  assert(rows.size() == N && storage(rows) == st);
  assert(tuib_table_free(t) == TUIB_OK);

  TuibTabs tabs{};
  assert(tuib_tabs_new(&tabs) == TUIB_OK);
  assert(tuib_tabs_reserve_titles(tabs, N) == TUIB_OK);
  const auto& titles = reg.get<TabsState>(tabs.id)->titles;
  st = storage(titles);
  for (size_t i = 0; i < N; ++i) assert(tuib_tabs_append_title(tabs, "t", 1, plain) == TUIB_OK);
  assert(titles.size() == N && storage(titles) == st);
  assert(tuib_tabs_free(tabs) == TUIB_OK);

  TuibBarChart bc{};
  assert(tuib_barchart_new(&bc) == TUIB_OK);
  assert(tuib_barchart_reserve_bars(bc, N) == TUIB_OK);
  const BarChartState& bars = *reg.get<BarChartState>(bc.id);
  const auto values_st = storage(bars.values);
  const auto labels_st = storage(bars.labels);
  for (size_t i = 0; i < N; ++i) assert(tuib_barchart_append_bar(bc, i, "b", 1) == TUIB_OK);
  assert(bars.values.size() == N && storage(bars.values) == values_st);
  assert(bars.labels.size() == N && storage(bars.labels) == labels_st);
  assert(tuib_barchart_free(bc) == TUIB_OK);

  TuibSparkline sp{};
  assert(tuib_sparkline_new(&sp) == TUIB_OK);
  assert(tuib_sparkline_reserve_values(sp, N) == TUIB_OK);
  const auto& samples = reg.get<SparklineState>(sp.id)->values;
  const auto samples_st = storage(samples);
  for (size_t i = 0; i < N; ++i) assert(tuib_sparkline_append_value(sp, i) == TUIB_OK);
  assert(samples.size() == N && storage(samples) == samples_st);
  assert(tuib_sparkline_free(sp) == TUIB_OK);

  TuibChart ch{};
  assert(tuib_chart_new(&ch) == TUIB_OK);
  assert(tuib_chart_reserve_datasets(ch, N) == TUIB_OK);
  const auto& datasets = reg.get<ChartState>(ch.id)->datasets;
  const auto datasets_st = storage(datasets);
  for (size_t i = 0; i < N; ++i)
    assert(tuib_chart_add_dataset(ch, "d", 1, nullptr, 0, plain, 0, nullptr) == TUIB_OK);
  assert(datasets.size() == N && storage(datasets) == datasets_st);
  assert(tuib_chart_reserve_points(ch, 0, N) == TUIB_OK);
  const auto& points = datasets[0].points;
  const auto points_st = storage(points);
  const TuibPoint pt{1.0, 2.0};
  for (size_t i = 0; i < N; ++i) assert(tuib_chart_append_points(ch, 0, &pt, 1) == TUIB_OK);
  assert(points.size() == N && storage(points) == points_st);
  assert(tuib_chart_free(ch) == TUIB_OK);

  if (tuib_feature_bits() & TUIB_FEATURE_CANVAS) {
    TuibCanvas cv{};
    assert(tuib_canvas_new(0.0, 1.0, 0.0, 1.0, &cv) == TUIB_OK);
    assert(tuib_canvas_reserve_shapes(cv, N) == TUIB_OK);
    const CanvasState& shapes = *reg.get<CanvasState>(cv.id);
    const auto segs_st = storage(shapes.lines);
    const auto rects_st = storage(shapes.rects);
    const auto sets_st = storage(shapes.points);
    for (size_t i = 0; i < N; ++i) {
      assert(tuib_canvas_add_line(cv, 0.0, 0.0, 1.0, 1.0, plain) == TUIB_OK);
      assert(tuib_canvas_add_rect(cv, 0.0, 0.0, 0.5, 0.5, plain) == TUIB_OK);
      assert(tuib_canvas_add_points(cv, &pt, 1, plain) == TUIB_OK);
    }
    assert(storage(shapes.lines) == segs_st && storage(shapes.rects) == rects_st);
    assert(storage(shapes.points) == sets_st && shapes.points.size() == N);
    assert(tuib_canvas_free(cv) == TUIB_OK);
  }
}

int main() {
  slots_and_generations();
  reserve_presizes_storage();
  return 0;
}
