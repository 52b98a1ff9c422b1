#include "layout.hpp"
#include <algorithm>
#include <cmath>

Rect apply_margins(const Rect& area, const Margins& m) {
  Rect r = area;
  if (m.left >= 0 && m.right >= 0 && m.left + m.right < area.width) {
    r.x += m.left;
    r.width -= m.left + m.right;
  }
  if (m.top >= 0 && m.bottom >= 0 && m.top + m.bottom < area.height) {
    r.y += m.top;
    r.height -= m.top + m.bottom;
  }
  return r;
}

static bool proportional(Constraint::Kind k) {
  return k == Constraint::Kind::Percent || k == Constraint::Kind::Ratio;
}

std::vector<Rect> split(const Rect& parent, Direction dir, const std::vector<Constraint>& constraints,
                        int spacing, const Margins& margins) {
  std::vector<Rect> out;
  const size_t n = constraints.size();
  if (n == 0) return out;
  Rect area = apply_margins(parent, margins);
  const bool horiz = dir == Direction::Horizontal;
  const long total = std::max(0, horiz ? area.width : area.height);
  spacing = std::max(0, spacing);
  const long avail = std::max(0L, total - static_cast<long>(spacing) * static_cast<long>(n - 1));

  std::vector<long> size(n, 0);
  std::vector<bool> has_frac(n, false);
  long double frac_sum = 0.0L;
  for (size_t i = 0; i < n; ++i) {
    const Constraint& c = constraints[i];
    long num = 0, den = 1;
    switch (c.kind) {
      case Constraint::Kind::Fixed:
      case Constraint::Kind::Min:
        size[i] = c.a;
        break;
      case Constraint::Kind::Max:
        size[i] = std::min<long>(c.a, avail);
        break;
      case Constraint::Kind::Percent:
        num = avail * static_cast<long>(std::min<uint32_t>(c.a, 100));
        den = 100;
        break;
      case Constraint::Kind::Ratio:
        num = avail * static_cast<long>(c.a);
        den = c.b == 0 ? 1 : static_cast<long>(c.b);
        break;
    }
    if (proportional(c.kind)) {
      size[i] = num / den;
      long rem = num % den;
      has_frac[i] = rem != 0;
      frac_sum += static_cast<long double>(rem) / static_cast<long double>(den);
    }
  }

  long remainder = static_cast<long>(std::floor(frac_sum + 1e-9L));
  for (size_t i = 0; i < n && remainder > 0; ++i) {
    if (has_frac[i]) { ++size[i]; --remainder; }
  }

  long used = 0;
  for (long s : size) used += s;
  if (used < avail) {
    long slack = avail - used;
    int target = -1;
    for (size_t i = 0; i < n; ++i)
      if (constraints[i].kind == Constraint::Kind::Min) { target = static_cast<int>(i); break; }
    if (target < 0) {
      for (size_t i = n; i-- > 0;)
        if (proportional(constraints[i].kind)) { target = static_cast<int>(i); break; }
    }
    if (target >= 0) size[target] += slack;
  } else if (used > avail) {
    long excess = used - avail;
    for (size_t i = n; i-- > 0 && excess > 0;) {
      long cut = std::min(size[i], excess);
      size[i] -= cut;
      excess -= cut;
    }
  }

  const long start = horiz ? area.x : area.y;
  const long end = start + total;
  long pos = start;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    long p = std::min(pos, end);
    long len = std::min(size[i], end - p);
    if (horiz) out.push_back(Rect{static_cast<int>(p), area.y, static_cast<int>(len), area.height});
    else out.push_back(Rect{area.x, static_cast<int>(p), area.width, static_cast<int>(len)});
    pos = p + len + spacing;
  }
  return out;
}
