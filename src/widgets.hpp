#pragma once
/*
 * Widgets
 *
 * Purpose: per-kind widget records owned by the Registry.
 * Note: the kind set is closed; WidgetData holds exactly one record per kind
 *       that carries state (Clear and Logo are stateless).
 */
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "block.hpp"
#include "style.hpp"
#include "text.hpp"
#include "types.hpp"

enum class WidgetKind : uint32_t {
  Paragraph = 1,
  List = 2,
  Table = 3,
  Gauge = 4,
  Tabs = 5,
  BarChart = 6,
  Sparkline = 7,
  Chart = 8,
  Scrollbar = 9,
  LineGauge = 10,
  Clear = 11,
  Logo = 12,
  Canvas = 13,
};

bool widget_kind_valid(uint32_t raw);
bool widget_kind_stateless(WidgetKind k);
const char* widget_kind_name(WidgetKind k);

enum class HighlightSpacing { Always = 0, Never = 1, WhenSelected = 2 };
enum class ListDirection { TopToBottom = 0, BottomToTop = 1 };
enum class GraphType { Line = 0, Bar = 1, Scatter = 2 };
enum class Marker { Dot = 0, Block = 1, Bar = 2, Braille = 3, HalfBlock = 4 };
enum class ScrollbarSide { VerticalLeft = 0, VerticalRight = 1, HorizontalTop = 2, HorizontalBottom = 3 };
enum class LegendPosition { TopRight = 0, TopLeft = 1, BottomRight = 2, BottomLeft = 3, None = 4 };

struct ParagraphState {
  std::vector<Line> lines;
  Alignment alignment = Alignment::Left;
  bool wrap = false;
  bool trim = true;
  int scroll_x = 0;
  int scroll_y = 0;
  Style style;
  std::optional<BlockSpec> block;
};

struct ListState {
  std::vector<Line> items;
  int selected = -1;
  int offset = 0;
  Style style;
  Style highlight_style;
  std::string highlight_symbol;
  ListDirection direction = ListDirection::TopToBottom;
  HighlightSpacing spacing = HighlightSpacing::WhenSelected;
  std::optional<BlockSpec> block;
};

using TableCell = std::vector<Line>;

struct TableState {
  std::vector<TableCell> header;
  std::vector<std::vector<TableCell>> rows;
  std::vector<uint16_t> widths_pct;
  int column_spacing = 1;
  int row_height = 1;
  int selected = -1;
  Style style;
  Style header_style;
  Style row_highlight_style;
  std::string highlight_symbol;
  HighlightSpacing spacing = HighlightSpacing::WhenSelected;
  std::optional<BlockSpec> block;
};

struct GaugeState {
  double ratio = 0.0;
  std::optional<Span> label; // single run, see join_spans
  Style style;
  Style gauge_style;
  std::optional<BlockSpec> block;
};

struct LineGaugeState {
  double ratio = 0.0;
  std::optional<Line> label; // spans keep their own styles
  Style style;
  Style filled_style;
  Style unfilled_style;
  std::optional<BlockSpec> block;
};

struct TabsState {
  std::vector<Line> titles;
  int selected = 0;
  Style style;
  Style highlight_style;
  Span divider{"\xE2\x94\x82", Style{}}; // empty text: no divider
  std::optional<BlockSpec> block;
};

struct BarChartState {
  std::vector<uint64_t> values;
  std::vector<Span> labels; // one single-run label per bar
  int bar_width = 1;
  int bar_gap = 1;
  Style bar_style;
  Style value_style;
  Style label_style;
  std::optional<BlockSpec> block;
};

struct SparklineState {
  std::vector<uint64_t> values;
  uint64_t max = 0; // 0: use the largest value
  Style style;
  std::optional<BlockSpec> block;
};

struct Dataset {
  std::string name;
  std::vector<std::pair<double, double>> points;
  Style style;
  GraphType graph_type = GraphType::Line;
};

struct Axis {
  std::string title;
  Style style;
  double min = 0.0;
  double max = 0.0;
  std::vector<Line> labels;
};

struct ChartState {
  std::vector<Dataset> datasets;
  Axis x_axis;
  Axis y_axis;
  LegendPosition legend = LegendPosition::TopRight;
  Style style;
  std::optional<BlockSpec> block;
};

struct ScrollbarState {
  ScrollbarSide side = ScrollbarSide::VerticalRight;
  int content_length = 0;
  int position = 0;
  int viewport_length = 0;
  Style thumb_style;
  Style track_style;
};

struct CanvasLine { double x1, y1, x2, y2; Style style; };
struct CanvasRect { double x, y, w, h; Style style; };
struct CanvasPoints { std::vector<std::pair<double, double>> coords; Style style; };

struct CanvasState {
  double x_min = 0.0, x_max = 1.0;
  double y_min = 0.0, y_max = 1.0;
  Color background;
  Marker marker = Marker::Braille;
  std::vector<CanvasLine> lines;
  std::vector<CanvasRect> rects;
  std::vector<CanvasPoints> points;
  std::optional<BlockSpec> block;
};

using WidgetData = std::variant<ParagraphState, ListState, TableState, GaugeState, TabsState,
                                BarChartState, SparklineState, ChartState, ScrollbarState,
                                LineGaugeState, CanvasState>;

template <class T> struct WidgetKindOf;
template <> struct WidgetKindOf<ParagraphState> { static constexpr WidgetKind value = WidgetKind::Paragraph; };
template <> struct WidgetKindOf<ListState> { static constexpr WidgetKind value = WidgetKind::List; };
template <> struct WidgetKindOf<TableState> { static constexpr WidgetKind value = WidgetKind::Table; };
template <> struct WidgetKindOf<GaugeState> { static constexpr WidgetKind value = WidgetKind::Gauge; };
template <> struct WidgetKindOf<TabsState> { static constexpr WidgetKind value = WidgetKind::Tabs; };
template <> struct WidgetKindOf<BarChartState> { static constexpr WidgetKind value = WidgetKind::BarChart; };
template <> struct WidgetKindOf<SparklineState> { static constexpr WidgetKind value = WidgetKind::Sparkline; };
template <> struct WidgetKindOf<ChartState> { static constexpr WidgetKind value = WidgetKind::Chart; };
template <> struct WidgetKindOf<ScrollbarState> { static constexpr WidgetKind value = WidgetKind::Scrollbar; };
template <> struct WidgetKindOf<LineGaugeState> { static constexpr WidgetKind value = WidgetKind::LineGauge; };
template <> struct WidgetKindOf<CanvasState> { static constexpr WidgetKind value = WidgetKind::Canvas; };

WidgetKind kind_of(const WidgetData& d);

// Per-kind text setters; each applies its own concatenation rule.
void paragraph_append_spans(ParagraphState& p, std::vector<Span> spans);
void paragraph_append_line(ParagraphState& p, std::vector<Span> spans);
void gauge_set_label_spans(GaugeState& g, const std::vector<Span>& spans);
void line_gauge_set_label_spans(LineGaugeState& g, std::vector<Span> spans);
void tabs_set_divider_spans(TabsState& t, const std::vector<Span>& spans);
void bar_chart_set_labels(BarChartState& c, const std::vector<std::vector<Span>>& labels);
