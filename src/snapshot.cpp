#include "snapshot.hpp"
#include <fmt/format.h>
#include <iterator>

std::string snapshot_text(const CellBuffer& buf) {
  std::string s;
  s.reserve(static_cast<size_t>(buf.width() + 1) * buf.height());
  for (int y = 0; y < buf.height(); ++y) {
    for (int x = 0; x < buf.width(); ++x) append_utf8(s, buf.at(x, y).codepoint);
    if (y + 1 < buf.height()) s.push_back('\n');
  }
  return s;
}

template <class CellFormatter>
static std::string style_dump(const CellBuffer& buf, size_t cell_chars, CellFormatter&& fmt_cell) {
  std::string s;
  s.reserve((cell_chars + 1) * static_cast<size_t>(buf.width()) * buf.height());
  auto out = std::back_inserter(s);
  for (int y = 0; y < buf.height(); ++y) {
    for (int x = 0; x < buf.width(); ++x) {
      fmt_cell(out, buf.at(x, y).style);
      if (x + 1 < buf.width()) s.push_back(' ');
    }
    if (y + 1 < buf.height()) s.push_back('\n');
  }
  return s;
}

std::string snapshot_styles(const CellBuffer& buf) {
  return style_dump(buf, 8, [](auto out, const Style& st) {
    fmt::format_to(out, "{:02X}{:02X}{:04X}", static_cast<unsigned>(compact_color_code(st.fg)),
                   static_cast<unsigned>(compact_color_code(st.bg)), st.mods);
  });
}

std::string snapshot_styles_ex(const CellBuffer& buf) {
  return style_dump(buf, 20, [](auto out, const Style& st) {
    fmt::format_to(out, "{:08X}{:08X}{:04X}", encode_color(st.fg), encode_color(st.bg), st.mods);
  });
}

size_t snapshot_cells(const CellBuffer& buf, CellRecord* out, size_t cap) {
  const size_t total = static_cast<size_t>(buf.width()) * buf.height();
  if (!out) return total;
  const size_t n = std::min(total, cap);
  for (size_t i = 0; i < n; ++i) {
    const int x = static_cast<int>(i % buf.width()), y = static_cast<int>(i / buf.width());
    const Cell& c = buf.at(x, y);
    out[i] = CellRecord{c.codepoint, encode_color(c.style.fg), encode_color(c.style.bg), c.style.mods};
  }
  return total;
}
