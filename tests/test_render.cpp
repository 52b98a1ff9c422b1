#include "renderer.hpp"
#include "snapshot.hpp"
#include <cassert>
#include <string>
#include <vector>

static CellBuffer render_ok(const Registry& reg, const std::vector<DrawCommand>& cmds, int w, int h) {
  Renderer r;
  CellBuffer out;
  std::string err;
  RenderResult res = r.render(reg, cmds, w, h, out, err);
  assert(res == RenderResult::Ok);
  assert(out.width() == w && out.height() == h);
  return out;
}

static WidgetId paragraph(Registry& reg, const std::string& text, Style st = Style{}) {
  ParagraphState p;
  p.lines = lines_from_text(text, st);
  return reg.create(std::move(p));
}

static void hello_frame() {
  Registry reg;
  WidgetId p = paragraph(reg, "Hello");
  CellBuffer f = render_ok(reg, {{WidgetKind::Paragraph, p, Rect{0, 0, 5, 1}}}, 5, 1);
  assert(snapshot_text(f) == "Hello");
  assert(snapshot_styles(f) == "00000000 00000000 00000000 00000000 00000000");
  // same inputs, same frame
  assert(render_ok(reg, {{WidgetKind::Paragraph, p, Rect{0, 0, 5, 1}}}, 5, 1) == f);
}

static void paint_order_and_clipping() {
  Registry reg;
  WidgetId a = paragraph(reg, "aaaa");
  WidgetId b = paragraph(reg, "bb");
  CellBuffer f = render_ok(reg, {{WidgetKind::Paragraph, a, Rect{0, 0, 4, 1}},
                                 {WidgetKind::Paragraph, b, Rect{0, 0, 4, 1}}}, 4, 1);
  assert(snapshot_text(f) == "bbaa");

  f = render_ok(reg, {{WidgetKind::Paragraph, a, Rect{0, 0, 4, 1}}, {WidgetKind::Clear, 0, Rect{1, 0, 2, 1}}}, 4, 1);
  assert(snapshot_text(f) == "a  a");

  WidgetId h = paragraph(reg, "Hello");
  f = render_ok(reg, {{WidgetKind::Paragraph, h, Rect{3, 0, 10, 1}}}, 5, 1);
  assert(snapshot_text(f) == "   He");
  f = render_ok(reg, {{WidgetKind::Paragraph, h, Rect{10, 10, 5, 5}}}, 5, 1);
  assert(snapshot_text(f) == "     ");
  f = render_ok(reg, {}, 3, 2);
  assert(snapshot_text(f) == "   \n   ");
}

static void rejected_batches() {
  Registry reg;
  WidgetId p = paragraph(reg, "keep");
  WidgetId l = reg.create(ListState{});
  Renderer r;
  std::string err;
  CellBuffer out = render_ok(reg, {{WidgetKind::Paragraph, p, Rect{0, 0, 4, 1}}}, 4, 1);
  const CellBuffer before = out;

  assert(r.render(reg, {{WidgetKind::Paragraph, l, Rect{0, 0, 4, 1}}}, 4, 1, out, err) == RenderResult::InvalidHandle);
  assert(!err.empty());
  assert(out == before);

  assert(r.render(reg, {{WidgetKind::Clear, 0, Rect{0, 0, 4, 1}}, {static_cast<WidgetKind>(99), p, Rect{}}}, 4, 1,
                  out, err) == RenderResult::InvalidKind);
  assert(out == before);

  assert(reg.free(p, WidgetKind::Paragraph));
  assert(r.render(reg, {{WidgetKind::Paragraph, p, Rect{0, 0, 4, 1}}}, 4, 1, out, err) == RenderResult::InvalidHandle);
  assert(snapshot_text(out) == "keep");

  // stateless kinds ignore the handle
  CellBuffer f = render_ok(reg, {{WidgetKind::Clear, 12345, Rect{0, 0, 4, 1}}}, 4, 1);
  assert(snapshot_text(f) == "    ");
}

static void paragraph_options() {
  Registry reg;
  Style red;
  red.fg = Color::named(COLOR_NAMED_RED);
  ParagraphState p;
  p.lines = lines_from_text("hello world", Style{});
  p.wrap = true;
  p.style = red;
  WidgetId id = reg.create(std::move(p));
  CellBuffer f = render_ok(reg, {{WidgetKind::Paragraph, id, Rect{0, 0, 7, 2}}}, 7, 2);
  assert(snapshot_text(f) == "hello  \nworld  ");
  assert(f.at(6, 1).style.fg == Color::named(COLOR_NAMED_RED));

  ParagraphState c;
  Style blue_bg;
  blue_bg.bg = Color::named(COLOR_NAMED_BLUE);
  c.lines = lines_from_text("ab", blue_bg);
  c.alignment = Alignment::Center;
  c.style = red;
  id = reg.create(std::move(c));
  f = render_ok(reg, {{WidgetKind::Paragraph, id, Rect{0, 0, 6, 1}}}, 6, 1);
  assert(snapshot_text(f) == "  ab  ");
  // span style patched over the widget style
  assert(f.at(2, 0).style.fg == Color::named(COLOR_NAMED_RED));
  assert(f.at(2, 0).style.bg == Color::named(COLOR_NAMED_BLUE));

  ParagraphState s;
  s.lines = lines_from_text("one\ntwo\nthree", Style{});
  s.scroll_y = 1;
  s.scroll_x = 1;
  id = reg.create(std::move(s));
  f = render_ok(reg, {{WidgetKind::Paragraph, id, Rect{0, 0, 4, 2}}}, 4, 2);
  assert(snapshot_text(f) == "wo  \nhree");
}

static void block_frame() {
  Registry reg;
  ParagraphState p;
  p.lines = lines_from_text("ab", Style{});
  BlockSpec b;
  b.borders = BORDER_ALL;
  p.block = b;
  WidgetId id = reg.create(std::move(p));
  CellBuffer f = render_ok(reg, {{WidgetKind::Paragraph, id, Rect{0, 0, 4, 3}}}, 4, 3);
  assert(snapshot_text(f) ==
         "\xE2\x94\x8C\xE2\x94\x80\xE2\x94\x80\xE2\x94\x90\n"
         "\xE2\x94\x82" "ab" "\xE2\x94\x82\n"
         "\xE2\x94\x94\xE2\x94\x80\xE2\x94\x80\xE2\x94\x98");

  BlockSpec titled;
  titled.title = line_from_text("T", Style{});
  titled.title_alignment = Alignment::Right;
  assert(block_inner(titled, Rect{0, 0, 5, 3}) == (Rect{0, 1, 5, 2}));
  CellBuffer buf(5, 3);
  draw_block(buf, titled, buf.area());
  assert(buf.at(4, 0).codepoint == 'T');
}

static void gauges() {
  Registry reg;
  GaugeState g;
  g.ratio = 0.5;
  WidgetId gid = reg.create(g);
  CellBuffer f = render_ok(reg, {{WidgetKind::Gauge, gid, Rect{0, 0, 10, 1}}}, 10, 1);
  assert(snapshot_text(f) == "\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88" "50%    ");
  assert(f.at(3, 0).style.mods & MOD_REVERSED);
  assert(!(f.at(5, 0).style.mods & MOD_REVERSED));

  LineGaugeState lg;
  lg.ratio = 0.5;
  WidgetId lid = reg.create(lg);
  f = render_ok(reg, {{WidgetKind::LineGauge, lid, Rect{0, 0, 10, 1}}}, 10, 1);
  assert(snapshot_text(f) == "50% \xE2\x94\x81\xE2\x94\x81\xE2\x94\x81\xE2\x94\x80\xE2\x94\x80\xE2\x94\x80");
}

static void tabs_and_list() {
  Registry reg;
  TabsState t;
  t.titles = {line_from_text("A", Style{}), line_from_text("B", Style{})};
  t.selected = 1;
  t.highlight_style.mods = MOD_BOLD;
  WidgetId tid = reg.create(t);
  CellBuffer f = render_ok(reg, {{WidgetKind::Tabs, tid, Rect{0, 0, 8, 1}}}, 8, 1);
  assert(snapshot_text(f) == " A \xE2\x94\x82 B  ");
  assert(f.at(5, 0).style.mods == MOD_BOLD);
  assert(f.at(1, 0).style.mods == 0);

  ListState l;
  l.items = {line_from_text("a", Style{}), line_from_text("b", Style{}), line_from_text("c", Style{})};
  l.selected = 1;
  l.highlight_symbol = ">";
  l.highlight_style.mods = MOD_REVERSED;
  WidgetId lid = reg.create(l);
  f = render_ok(reg, {{WidgetKind::List, lid, Rect{0, 0, 3, 3}}}, 3, 3);
  assert(snapshot_text(f) == " a \n>b \n c ");
  assert(f.at(2, 1).style.mods == MOD_REVERSED);

  reg.get<ListState>(lid)->direction = ListDirection::BottomToTop;
  f = render_ok(reg, {{WidgetKind::List, lid, Rect{0, 0, 3, 3}}}, 3, 3);
  assert(snapshot_text(f) == " c \n>b \n a ");

  // selection kept on screen in a short viewport
  reg.get<ListState>(lid)->direction = ListDirection::TopToBottom;
  reg.get<ListState>(lid)->selected = 2;
  f = render_ok(reg, {{WidgetKind::List, lid, Rect{0, 0, 3, 1}}}, 3, 1);
  assert(snapshot_text(f) == ">c ");
}

static void table_columns() {
  Registry reg;
  TableState t;
  t.header = {TableCell{line_from_text("h1", Style{})}, TableCell{line_from_text("h2", Style{})}};
  t.rows = {{TableCell{line_from_text("a", Style{})}, TableCell{line_from_text("b", Style{})}}};
  WidgetId id = reg.create(t);
  CellBuffer f = render_ok(reg, {{WidgetKind::Table, id, Rect{0, 0, 9, 2}}}, 9, 2);
  assert(snapshot_text(f) == "h1   h2  \na    b   ");
}

static void charts_and_bars() {
  Registry reg;
  SparklineState s;
  s.values = {0, 4, 8};
  WidgetId sid = reg.create(s);
  CellBuffer f = render_ok(reg, {{WidgetKind::Sparkline, sid, Rect{0, 0, 3, 1}}}, 3, 1);
  assert(f.at(0, 0).codepoint == ' ');
  assert(f.at(1, 0).codepoint == 0x2584);
  assert(f.at(2, 0).codepoint == 0x2588);

  BarChartState b;
  b.values = {8};
  WidgetId bid = reg.create(b);
  f = render_ok(reg, {{WidgetKind::BarChart, bid, Rect{0, 0, 1, 2}}}, 1, 2);
  assert(f.at(0, 0).codepoint == 0x2588);
  assert(f.at(0, 1).codepoint == '8');

  ScrollbarState sb;
  sb.content_length = 10;
  sb.viewport_length = 3;
  WidgetId scid = reg.create(sb);
  f = render_ok(reg, {{WidgetKind::Scrollbar, scid, Rect{0, 0, 1, 5}}}, 1, 5);
  assert(snapshot_text(f) == "\xE2\x86\x91\n\xE2\x96\x88\n\xE2\x95\x91\n\xE2\x95\x91\n\xE2\x86\x93");

  CanvasState c;
  c.marker = Marker::Block;
  c.points.push_back(CanvasPoints{{{0.0, 0.0}, {1.0, 1.0}}, Style{}});
  WidgetId cid = reg.create(c);
  f = render_ok(reg, {{WidgetKind::Canvas, cid, Rect{0, 0, 4, 2}}}, 4, 2);
  assert(f.at(0, 1).codepoint == 0x2588);
  assert(f.at(3, 0).codepoint == 0x2588);

  ChartState ch;
  ch.x_axis.min = 0;
  ch.x_axis.max = 10;
  ch.y_axis.min = 0;
  ch.y_axis.max = 10;
  ch.datasets.push_back(Dataset{"d", {{0, 0}, {10, 10}}, Style{}, GraphType::Scatter});
  WidgetId chid = reg.create(ch);
  CellBuffer a = render_ok(reg, {{WidgetKind::Chart, chid, Rect{0, 0, 20, 8}}}, 20, 8);
  assert(render_ok(reg, {{WidgetKind::Chart, chid, Rect{0, 0, 20, 8}}}, 20, 8) == a);

  f = render_ok(reg, {{WidgetKind::Logo, 0, Rect{0, 0, 30, 6}}}, 30, 6);
  assert(f.at(3, 1).codepoint == 'T');
}

static void canvas_lines_are_clipped() {
  Registry reg;
  std::string bar;
  for (int i = 0; i < 10; ++i) bar += "\xE2\x96\x88";
  const std::string blank(10, ' ');

  // far endpoints are trimmed to the bounds before rasterising
  CanvasState c;
  c.marker = Marker::Block;
  c.lines.push_back(CanvasLine{0.0, 0.5, 1.1e8, 0.5, Style{}});
  c.lines.push_back(CanvasLine{-1e300, 0.5, 1e300, 0.5, Style{}});
  WidgetId cid = reg.create(c);
  CellBuffer f = render_ok(reg, {{WidgetKind::Canvas, cid, Rect{0, 0, 10, 4}}}, 10, 4);
  assert(snapshot_text(f) == blank + "\n" + blank + "\n" + bar + "\n" + blank);

  CanvasState d;
  d.marker = Marker::Block;
  d.lines.push_back(CanvasLine{-1.0, -1.0, 2.0, 2.0, Style{}});
  d.lines.push_back(CanvasLine{2.0, 2.0, 3.0, 3.0, Style{}});
  WidgetId did = reg.create(d);
  f = render_ok(reg, {{WidgetKind::Canvas, did, Rect{0, 0, 4, 4}}}, 4, 4);
  for (int i = 0; i < 4; ++i) assert(f.at(i, 3 - i).codepoint == 0x2588);
  assert(f.at(0, 0).codepoint == ' ' && f.at(3, 3).codepoint == ' ');

  // every edge of this rectangle lies outside the canvas
  CanvasState e;
  e.marker = Marker::Block;
  e.rects.push_back(CanvasRect{-1e200, -1e200, 1e300, 1e300, Style{}});
  WidgetId eid = reg.create(e);
  f = render_ok(reg, {{WidgetKind::Canvas, eid, Rect{0, 0, 10, 4}}}, 10, 4);
  assert(snapshot_text(f) == blank + "\n" + blank + "\n" + blank + "\n" + blank);
}

int main() {
  hello_frame();
  paint_order_and_clipping();
  rejected_batches();
  paragraph_options();
  block_frame();
  gauges();
  tabs_and_list();
  table_columns();
  charts_and_bars();
  canvas_lines_are_clipped();
  return 0;
}
