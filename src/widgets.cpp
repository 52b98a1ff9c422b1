#include "widgets.hpp"

bool widget_kind_valid(uint32_t raw) {
  return raw >= static_cast<uint32_t>(WidgetKind::Paragraph) && raw <= static_cast<uint32_t>(WidgetKind::Canvas);
}

bool widget_kind_stateless(WidgetKind k) { return k == WidgetKind::Clear || k == WidgetKind::Logo; }

const char* widget_kind_name(WidgetKind k) {
  switch (k) {
    case WidgetKind::Paragraph: return "Paragraph";
    case WidgetKind::List: return "List";
    case WidgetKind::Table: return "Table";
    case WidgetKind::Gauge: return "Gauge";
    case WidgetKind::Tabs: return "Tabs";
    case WidgetKind::BarChart: return "BarChart";
    case WidgetKind::Sparkline: return "Sparkline";
    case WidgetKind::Chart: return "Chart";
    case WidgetKind::Scrollbar: return "Scrollbar";
    case WidgetKind::LineGauge: return "LineGauge";
    case WidgetKind::Clear: return "Clear";
    case WidgetKind::Logo: return "Logo";
    case WidgetKind::Canvas: return "Canvas";
  }
  return "Unknown";
}

WidgetKind kind_of(const WidgetData& d) {
  return std::visit([](const auto& w) { return WidgetKindOf<std::decay_t<decltype(w)>>::value; }, d);
}

void paragraph_append_spans(ParagraphState& p, std::vector<Span> spans) {
  if (p.lines.empty()) p.lines.emplace_back();
  auto& dst = p.lines.back().spans;
  for (auto& sp : spans) dst.push_back(std::move(sp));
}

void paragraph_append_line(ParagraphState& p, std::vector<Span> spans) {
  Line l;
  l.spans = std::move(spans);
  p.lines.push_back(std::move(l));
}

void gauge_set_label_spans(GaugeState& g, const std::vector<Span>& spans) {
  g.label = join_spans(spans);
}

void line_gauge_set_label_spans(LineGaugeState& g, std::vector<Span> spans) {
  Line l;
  l.spans = std::move(spans);
  g.label = std::move(l);
}

void tabs_set_divider_spans(TabsState& t, const std::vector<Span>& spans) {
  if (spans.size() == 1) t.divider = spans.front();
  else t.divider = join_spans(spans); // empty when no spans: divider removed
}

void bar_chart_set_labels(BarChartState& c, const std::vector<std::vector<Span>>& labels) {
  c.labels.clear();
  c.labels.reserve(labels.size());
  for (const auto& l : labels) c.labels.push_back(join_spans(l));
}
