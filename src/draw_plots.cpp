#include "draw.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <vector>

constexpr uint32_t DOT = 0x2022;

// Sub-cell raster shared by Chart and Canvas.
class PlotGrid {
public:
  PlotGrid(const Rect& area, Marker marker) : area_(area), marker_(marker) {
    sub_w_ = marker == Marker::Braille ? 2 : 1;
    sub_h_ = marker == Marker::Braille ? 4 : (marker == Marker::HalfBlock ? 2 : 1);
    const size_t n = static_cast<size_t>(std::max(0, area.width)) * std::max(0, area.height);
    mask_.assign(n, 0);
    upper_.assign(n, Style{});
    lower_.assign(n, Style{});
  }

  int res_w() const { return area_.width * sub_w_; }
  int res_h() const { return area_.height * sub_h_; }

  void paint(int px, int py, const Style& st) {
    if (px < 0 || py < 0 || px >= res_w() || py >= res_h()) return;
    const int cx = px / sub_w_, cy = py / sub_h_;
    const int sx = px % sub_w_, sy = py % sub_h_;
    const size_t i = static_cast<size_t>(cy) * area_.width + cx;
    if (marker_ == Marker::Braille) {
      static const uint8_t bits[4][2] = {{0x01, 0x08}, {0x02, 0x10}, {0x04, 0x20}, {0x40, 0x80}};
      mask_[i] |= bits[sy][sx];
      upper_[i] = st;
    } else if (marker_ == Marker::HalfBlock) {
      mask_[i] |= sy == 0 ? 1 : 2;
      (sy == 0 ? upper_[i] : lower_[i]) = st;
    } else {
      mask_[i] = 1;
      upper_[i] = st;
    }
  }

  void line(int x0, int y0, int x1, int y1, const Style& st) {
    int dx = std::abs(x1 - x0), dy = -std::abs(y1 - y0);
    int sx = x0 < x1 ? 1 : -1, sy = y0 < y1 ? 1 : -1;
    int err = dx + dy;
    for (;;) {
      paint(x0, y0, st);
      if (x0 == x1 && y0 == y1) break;
      int e2 = 2 * err;
      if (e2 >= dy) { err += dy; x0 += sx; }
      if (e2 <= dx) { err += dx; y0 += sy; }
    }
  }

  void flush(CellBuffer& buf) const {
    for (int cy = 0; cy < area_.height; ++cy) {
      for (int cx = 0; cx < area_.width; ++cx) {
        const size_t i = static_cast<size_t>(cy) * area_.width + cx;
        const uint8_t m = mask_[i];
        if (m == 0) continue;
        const int x = area_.x + cx, y = area_.y + cy;
        switch (marker_) {
          case Marker::Braille: buf.set(x, y, 0x2800u | m, upper_[i]); break;
          case Marker::HalfBlock:
            if (m == 3) {
              Style st = upper_[i];
              st.bg = lower_[i].fg;
              buf.set(x, y, 0x2580, st);
            } else {
              buf.set(x, y, m == 1 ? 0x2580 : 0x2584, m == 1 ? upper_[i] : lower_[i]);
            }
            break;
          case Marker::Dot: buf.set(x, y, DOT, upper_[i]); break;
          case Marker::Block: buf.set(x, y, 0x2588, upper_[i]); break;
          case Marker::Bar: buf.set(x, y, 0x2584, upper_[i]); break;
        }
      }
    }
  }

private:
  Rect area_;
  Marker marker_;
  int sub_w_ = 1, sub_h_ = 1;
  std::vector<uint8_t> mask_;
  std::vector<Style> upper_;
  std::vector<Style> lower_;
};

static int to_raster(double v, int res) {
  if (!(v >= 0.0)) return v < 0.0 ? -1 : 0;
  return static_cast<int>(std::lround(std::min(v, static_cast<double>(res))));
}

// Maps data coordinates onto a raster; y grows upwards in data space.
struct PlotMapping {
  double x_min, x_max, y_min, y_max;
  int res_w, res_h;

  bool valid() const { return x_max > x_min && y_max > y_min && res_w > 0 && res_h > 0; }
  bool inside(double x, double y) const { return x >= x_min && x <= x_max && y >= y_min && y <= y_max; }
  // Results stay within one step of the raster so line walks are bounded by its size.
  int px(double x) const { return to_raster((x - x_min) / (x_max - x_min) * (res_w - 1), res_w); }
  int py(double y) const { return to_raster((y_max - y) / (y_max - y_min) * (res_h - 1), res_h); }

  int outcode(double x, double y) const {
    int c = 0;
    if (x < x_min) c |= 1; else if (x > x_max) c |= 2;
    if (y < y_min) c |= 4; else if (y > y_max) c |= 8;
    return c;
  }

  // Cohen-Sutherland: trims the segment to the bounds; false when nothing is left.
  bool clip(double& x1, double& y1, double& x2, double& y2) const {
    if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) || !std::isfinite(y2)) return false;
    int c1 = outcode(x1, y1), c2 = outcode(x2, y2);
    for (int pass = 0; (c1 | c2) && pass < 8; ++pass) {
      if (c1 & c2) return false;
      const int out = c1 ? c1 : c2;
      double x, y;
      if (out & 8) { x = cross(x1, x2, y1, y2, y_max); y = y_max; }
      else if (out & 4) { x = cross(x1, x2, y1, y2, y_min); y = y_min; }
      else if (out & 2) { y = cross(y1, y2, x1, x2, x_max); x = x_max; }
      else { y = cross(y1, y2, x1, x2, x_min); x = x_min; }
      if (out == c1) { x1 = x; y1 = y; c1 = outcode(x1, y1); }
      else { x2 = x; y2 = y; c2 = outcode(x2, y2); }
    }
    return (c1 & c2) == 0;
  }

  // Value of a at the point where b reaches edge; halved terms keep extreme inputs finite.
  static double cross(double a1, double a2, double b1, double b2, double edge) {
    if (a1 == a2) return a1;
    const double t = std::clamp((edge / 2 - b1 / 2) / (b2 / 2 - b1 / 2), 0.0, 1.0);
    return a1 * (1.0 - t) + a2 * t;
  }
};

void draw_canvas(CellBuffer& buf, const CanvasState& c, const Rect& area) {
  Rect in = frame_inner(buf, c.block, Style{}, area);
  if (in.empty()) return;
  if (!c.background.is_reset()) {
    Style bg;
    bg.bg = c.background;
    buf.set_style(in, bg);
  }
  PlotGrid grid(in, c.marker);
  PlotMapping m{c.x_min, c.x_max, c.y_min, c.y_max, grid.res_w(), grid.res_h()};
  if (!m.valid()) return;
  auto seg = [&](double x1, double y1, double x2, double y2, const Style& st) {
    if (!m.clip(x1, y1, x2, y2)) return;
    grid.line(m.px(x1), m.py(y1), m.px(x2), m.py(y2), st);
  };
  for (const auto& l : c.lines) seg(l.x1, l.y1, l.x2, l.y2, l.style);
  for (const auto& r : c.rects) {
    seg(r.x, r.y, r.x + r.w, r.y, r.style);
    seg(r.x, r.y + r.h, r.x + r.w, r.y + r.h, r.style);
    seg(r.x, r.y, r.x, r.y + r.h, r.style);
    seg(r.x + r.w, r.y, r.x + r.w, r.y + r.h, r.style);
  }
  for (const auto& pts : c.points)
    for (const auto& p : pts.coords)
      if (m.inside(p.first, p.second)) grid.paint(m.px(p.first), m.py(p.second), pts.style);
  grid.flush(buf);
}

static int labels_width(const std::vector<Line>& labels) {
  int w = 0;
  for (const auto& l : labels) w = std::max(w, l.width());
  return w;
}

static void draw_legend(CellBuffer& buf, const ChartState& c, const Rect& plot) {
  std::vector<const Dataset*> named;
  int w = 0;
  for (const auto& d : c.datasets)
    if (!d.name.empty()) { named.push_back(&d); w = std::max(w, utf8_width(d.name)); }
  if (named.empty() || c.legend == LegendPosition::None) return;
  const int lw = w + 2, lh = static_cast<int>(named.size()) + 2;
  if (lw > plot.width || lh > plot.height) return;
  const bool left = c.legend == LegendPosition::TopLeft || c.legend == LegendPosition::BottomLeft;
  const bool top = c.legend == LegendPosition::TopLeft || c.legend == LegendPosition::TopRight;
  Rect box{left ? plot.x : plot.right() - lw, top ? plot.y : plot.bottom() - lh, lw, lh};
  buf.clear_area(box);
  BlockSpec b;
  b.borders = BORDER_ALL;
  Rect in = draw_block(buf, b, box);
  for (size_t i = 0; i < named.size(); ++i)
    buf.put_string(in.x, in.y + static_cast<int>(i), named[i]->name, named[i]->style, in.width);
}

void draw_chart(CellBuffer& buf, const ChartState& c, const Rect& area) {
  Rect in = frame_inner(buf, c.block, c.style, area);
  if (in.empty()) return;
  const int ylw = labels_width(c.y_axis.labels);
  const int xlab_rows = c.x_axis.labels.empty() ? 0 : 1;
  const int axis_x = in.x + ylw;     // column of the y axis line
  const int axis_y = in.bottom() - 1 - xlab_rows; // row of the x axis line
  if (axis_x >= in.right() || axis_y < in.y) return;

  for (int y = in.y; y < axis_y; ++y) buf.set(axis_x, y, 0x2502, c.y_axis.style);
  for (int x = axis_x + 1; x < in.right(); ++x) buf.set(x, axis_y, 0x2500, c.x_axis.style);
  buf.set(axis_x, axis_y, 0x2514, c.x_axis.style);

  const int ny = static_cast<int>(c.y_axis.labels.size());
  for (int i = 0; i < ny; ++i) {
    int row = ny == 1 ? axis_y : axis_y - i * (axis_y - in.y) / (ny - 1);
    const Line& l = c.y_axis.labels[i];
    buf.put_line(in.x + ylw - l.width(), row, l, c.y_axis.style, ylw);
  }
  const int nx = static_cast<int>(c.x_axis.labels.size());
  const int span = in.right() - (axis_x + 1);
  for (int i = 0; i < nx && span > 0; ++i) {
    const Line& l = c.x_axis.labels[i];
    int col = axis_x + 1;
    if (nx > 1) col += i * (span - 1) / (nx - 1);
    if (i == nx - 1 && nx > 1) col = std::max(axis_x + 1, in.right() - l.width());
    buf.put_line(col, axis_y + 1, l, c.x_axis.style, in.right() - col);
  }

  Rect plot{axis_x + 1, in.y, in.right() - axis_x - 1, axis_y - in.y};
  if (plot.empty()) return;
  if (!c.y_axis.title.empty()) buf.put_string(plot.x, plot.y, c.y_axis.title, c.y_axis.style, plot.width);
  if (!c.x_axis.title.empty()) {
    int tw = std::min(plot.width, utf8_width(c.x_axis.title));
    buf.put_string(plot.right() - tw, plot.bottom() - 1, c.x_axis.title, c.x_axis.style, tw);
  }

  PlotMapping m{c.x_axis.min, c.x_axis.max, c.y_axis.min, c.y_axis.max, plot.width, plot.height};
  if (m.valid()) {
    for (const auto& d : c.datasets) {
      const auto& pts = d.points;
      if (d.graph_type == GraphType::Line) {
        PlotGrid g(plot, Marker::Dot);
        for (size_t i = 0; i < pts.size(); ++i) {
          if (!m.inside(pts[i].first, pts[i].second)) continue;
          const int x0 = m.px(pts[i].first), y0 = m.py(pts[i].second);
          if (i + 1 < pts.size() && m.inside(pts[i + 1].first, pts[i + 1].second))
            g.line(x0, y0, m.px(pts[i + 1].first), m.py(pts[i + 1].second), d.style);
          else
            g.paint(x0, y0, d.style);
        }
        g.flush(buf);
        continue;
      }
      for (const auto& p : pts) {
        if (!m.inside(p.first, p.second)) continue;
        const int x = plot.x + m.px(p.first), y = plot.y + m.py(p.second);
        if (d.graph_type == GraphType::Scatter) {
          buf.set(x, y, DOT, d.style);
        } else {
          for (int yy = y; yy < plot.bottom(); ++yy) buf.set(x, yy, 0x2588, d.style);
        }
      }
    }
  }
  draw_legend(buf, c, plot);
}

void draw_clear(CellBuffer& buf, const Rect& area) { buf.clear_area(area); }

void draw_logo(CellBuffer& buf, const Rect& area) {
  const char* art[] = {
    "TTTTT  U   U  III  BBBB ",
    "  T    U   U   I   B   B",
    "  T    U   U   I   BBBB ",
    "  T     UUU   III  BBBB "
  };
  int lines = 4;
  int max_len = 0;
  for(int i=0;i<lines;i++){ int len = static_cast<int>(std::strlen(art[i])); if(len>max_len) max_len = len; }
  int start_row = area.y + std::max(0, (area.height - lines) / 2);
  int start_col = area.x + std::max(0, (area.width - max_len) / 2);
  for(int i=0;i<lines && start_row + i < area.bottom();i++){
    buf.put_string(start_col, start_row + i, art[i], Style{}, area.right() - start_col);
  }
}
