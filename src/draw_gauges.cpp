#include "draw.hpp"
#include <cmath>
#include <string>

constexpr uint32_t FULL_BLOCK = 0x2588;

static std::string percent_label(double ratio) {
  return std::to_string(static_cast<int>(std::lround(ratio * 100.0))) + "%";
}

// Lower block glyph for 0..8 eighths of a cell (0 means untouched).
static uint32_t eighth_block(int eighths) {
  if (eighths <= 0) return 0;
  if (eighths >= 8) return FULL_BLOCK;
  return 0x2580 + static_cast<uint32_t>(eighths);
}

static void draw_column(CellBuffer& buf, int x, int bottom, int rows, uint64_t eighths_total, const Style& st) {
  for (int r = 0; r < rows; ++r) {
    long long left = static_cast<long long>(eighths_total) - static_cast<long long>(r) * 8;
    uint32_t g = eighth_block(static_cast<int>(std::min<long long>(left, 8)));
    if (g == 0) break;
    buf.set(x, bottom - 1 - r, g, st);
  }
}

void draw_gauge(CellBuffer& buf, const GaugeState& g, const Rect& area) {
  Rect in = frame_inner(buf, g.block, g.style, area);
  if (in.empty()) return;
  const double ratio = std::clamp(g.ratio, 0.0, 1.0);
  const int filled = static_cast<int>(std::floor(ratio * in.width));
  for (int y = in.y; y < in.bottom(); ++y)
    for (int x = in.x; x < in.x + filled; ++x) buf.set(x, y, FULL_BLOCK, g.gauge_style);

  Span label = g.label ? *g.label : Span{percent_label(ratio), Style{}};
  std::vector<uint32_t> cps = decode_utf8(label.text);
  const int len = std::min(in.width, static_cast<int>(cps.size()));
  const int lx = in.x + (in.width - len) / 2;
  const int ly = in.y + in.height / 2;
  for (int i = 0; i < len; ++i) {
    const int x = lx + i;
    Style st = label.style;
    if (x < in.x + filled) {
      st = patch_style(g.gauge_style, label.style);
      st.mods |= MOD_REVERSED;
    }
    buf.set(x, ly, cps[i], st);
  }
}

void draw_line_gauge(CellBuffer& buf, const LineGaugeState& g, const Rect& area) {
  Rect in = frame_inner(buf, g.block, g.style, area);
  if (in.empty()) return;
  const double ratio = std::clamp(g.ratio, 0.0, 1.0);
  Line label = g.label ? *g.label : line_from_text(percent_label(ratio), Style{});
  const int used = buf.put_line(in.x, in.y, label, Style{}, in.width);
  const int start = in.x + used + 1;
  if (start >= in.right()) return;
  const int w = in.right() - start;
  const int filled = static_cast<int>(std::floor(ratio * w));
  for (int i = 0; i < w; ++i) {
    if (i < filled) buf.set(start + i, in.y, 0x2501, g.filled_style);
    else buf.set(start + i, in.y, 0x2500, g.unfilled_style);
  }
}

void draw_bar_chart(CellBuffer& buf, const BarChartState& c, const Rect& area) {
  Rect in = frame_inner(buf, c.block, Style{}, area);
  if (in.empty() || c.values.empty()) return;
  bool has_labels = false;
  for (const auto& l : c.labels) if (!l.text.empty()) { has_labels = true; break; }
  const int chart_h = in.height - (has_labels ? 1 : 0);
  const int bw = std::max(1, c.bar_width);
  uint64_t max = 0;
  for (uint64_t v : c.values) max = std::max(max, v);
  if (max == 0) max = 1;

  int x = in.x;
  for (size_t i = 0; i < c.values.size() && x + bw <= in.right(); ++i) {
    const uint64_t v = c.values[i];
    if (chart_h > 0) {
      const uint64_t eighths = static_cast<uint64_t>(static_cast<long double>(v) * chart_h * 8 / max);
      for (int k = 0; k < bw; ++k) draw_column(buf, x + k, in.y + chart_h, chart_h, eighths, c.bar_style);
      std::string value = std::to_string(v);
      if (v > 0 && static_cast<int>(value.size()) <= bw)
        buf.put_string(x + (bw - static_cast<int>(value.size())) / 2, in.y + chart_h - 1, value,
                       patch_style(c.bar_style, c.value_style), bw);
    }
    if (has_labels && i < c.labels.size()) {
      const Span& l = c.labels[i];
      int len = std::min(bw, utf8_width(l.text));
      buf.put_string(x + (bw - len) / 2, in.y + chart_h, l.text, patch_style(c.label_style, l.style), bw);
    }
    x += bw + std::max(0, c.bar_gap);
  }
}

void draw_sparkline(CellBuffer& buf, const SparklineState& s, const Rect& area) {
  Rect in = frame_inner(buf, s.block, Style{}, area);
  if (in.empty()) return;
  uint64_t max = s.max;
  if (max == 0) for (uint64_t v : s.values) max = std::max(max, v);
  if (max == 0) max = 1;
  const int n = std::min(in.width, static_cast<int>(s.values.size()));
  for (int i = 0; i < n; ++i) {
    const uint64_t v = std::min(s.values[i], max);
    const uint64_t eighths = static_cast<uint64_t>(static_cast<long double>(v) * in.height * 8 / max);
    draw_column(buf, in.x + i, in.bottom(), in.height, eighths, s.style);
  }
}

void draw_scrollbar(CellBuffer& buf, const ScrollbarState& s, const Rect& area) {
  if (area.empty()) return;
  const bool vertical = s.side == ScrollbarSide::VerticalLeft || s.side == ScrollbarSide::VerticalRight;
  const int len = vertical ? area.height : area.width;
  int fixed = 0;
  switch (s.side) {
    case ScrollbarSide::VerticalLeft: fixed = area.x; break;
    case ScrollbarSide::VerticalRight: fixed = area.right() - 1; break;
    case ScrollbarSide::HorizontalTop: fixed = area.y; break;
    case ScrollbarSide::HorizontalBottom: fixed = area.bottom() - 1; break;
  }
  const int origin = vertical ? area.y : area.x;
  auto put = [&](int i, uint32_t cp, const Style& st) {
    if (vertical) buf.set(fixed, origin + i, cp, st);
    else buf.set(origin + i, fixed, cp, st);
  };
  const bool arrows = len >= 3;
  const int track_start = arrows ? 1 : 0;
  const int track_len = arrows ? len - 2 : len;
  if (arrows) {
    put(0, vertical ? 0x2191 : 0x2190, s.track_style);
    put(len - 1, vertical ? 0x2193 : 0x2192, s.track_style);
  }
  const uint32_t track = vertical ? 0x2551 : 0x2550;
  for (int i = 0; i < track_len; ++i) put(track_start + i, track, s.track_style);
  if (s.content_length <= 0 || track_len <= 0) return;

  const long content = s.content_length;
  const long viewport = s.viewport_length > 0 ? s.viewport_length : track_len;
  const long thumb = std::clamp<long>(track_len * viewport / std::max(content, viewport), 1, track_len);
  const long pos = std::clamp<long>(s.position, 0, content - 1);
  const long start = content > 1 ? (track_len - thumb) * pos / (content - 1) : 0;
  for (long i = 0; i < thumb; ++i) put(track_start + static_cast<int>(start + i), FULL_BLOCK, s.thumb_style);
}
