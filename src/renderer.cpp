#include "renderer.hpp"
#include "draw.hpp"

RenderResult Renderer::validate(const Registry& reg, const std::vector<DrawCommand>& cmds, std::string& err) const {
  for (size_t i = 0; i < cmds.size(); ++i) {
    const DrawCommand& c = cmds[i];
    if (!widget_kind_valid(static_cast<uint32_t>(c.kind))) {
      err = "command " + std::to_string(i) + ": unknown widget kind " + std::to_string(static_cast<uint32_t>(c.kind));
      return RenderResult::InvalidKind;
    }
    if (widget_kind_stateless(c.kind)) continue;
    if (!reg.contains(c.handle, c.kind)) {
      err = "command " + std::to_string(i) + ": stale or mismatched " + widget_kind_name(c.kind) + " handle";
      return RenderResult::InvalidHandle;
    }
  }
  return RenderResult::Ok;
}

RenderResult Renderer::render(const Registry& reg, const std::vector<DrawCommand>& cmds, int width, int height,
                              CellBuffer& out, std::string& err) const {
  RenderResult r = validate(reg, cmds, err);
  if (r != RenderResult::Ok) return r;
  CellBuffer frame(width, height);
  for (const auto& c : cmds) paint(reg, c, frame);
  out = std::move(frame);
  return RenderResult::Ok;
}

void Renderer::paint(const Registry& reg, const DrawCommand& cmd, CellBuffer& buf) const {
  const Rect area = cmd.area.intersect(buf.area());
  if (area.empty()) return;
  switch (cmd.kind) {
    case WidgetKind::Paragraph: draw_paragraph(buf, *reg.get<ParagraphState>(cmd.handle), area); break;
    case WidgetKind::List: draw_list(buf, *reg.get<ListState>(cmd.handle), area); break;
    case WidgetKind::Table: draw_table(buf, *reg.get<TableState>(cmd.handle), area); break;
    case WidgetKind::Gauge: draw_gauge(buf, *reg.get<GaugeState>(cmd.handle), area); break;
    case WidgetKind::Tabs: draw_tabs(buf, *reg.get<TabsState>(cmd.handle), area); break;
    case WidgetKind::BarChart: draw_bar_chart(buf, *reg.get<BarChartState>(cmd.handle), area); break;
    case WidgetKind::Sparkline: draw_sparkline(buf, *reg.get<SparklineState>(cmd.handle), area); break;
    case WidgetKind::Chart: draw_chart(buf, *reg.get<ChartState>(cmd.handle), area); break;
    case WidgetKind::Scrollbar: draw_scrollbar(buf, *reg.get<ScrollbarState>(cmd.handle), area); break;
    case WidgetKind::LineGauge: draw_line_gauge(buf, *reg.get<LineGaugeState>(cmd.handle), area); break;
    case WidgetKind::Clear: draw_clear(buf, area); break;
    case WidgetKind::Logo: draw_logo(buf, area); break;
    case WidgetKind::Canvas: draw_canvas(buf, *reg.get<CanvasState>(cmd.handle), area); break;
  }
}
