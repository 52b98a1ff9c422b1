#include "text.hpp"

static int seq_len(unsigned char c) {
  if (c < 0x80) return 1;
  if (c >= 0xC2 && c <= 0xDF) return 2;
  if (c >= 0xE0 && c <= 0xEF) return 3;
  if (c >= 0xF0 && c <= 0xF4) return 4;
  return 0;
}

// Length of the valid sequence at p, or 0 when malformed.
static int valid_seq(const unsigned char* p, size_t avail, uint32_t& cp) {
  int n = seq_len(p[0]);
  if (n == 0 || static_cast<size_t>(n) > avail) return 0;
  if (n == 1) { cp = p[0]; return 1; }
  for (int i = 1; i < n; ++i) if ((p[i] & 0xC0) != 0x80) return 0;
  if (n == 2) cp = ((p[0] & 0x1Fu) << 6) | (p[1] & 0x3Fu);
  else if (n == 3) cp = ((p[0] & 0x0Fu) << 12) | ((p[1] & 0x3Fu) << 6) | (p[2] & 0x3Fu);
  else cp = ((p[0] & 0x07u) << 18) | ((p[1] & 0x3Fu) << 12) | ((p[2] & 0x3Fu) << 6) | (p[3] & 0x3Fu);
  if (n == 3 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return 0;
  if (n == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return 0;
  return n;
}

std::string sanitize_utf8(const char* data, size_t len) {
  std::string out;
  if (!data || len == 0) return out;
  out.reserve(len);
  const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
  size_t i = 0;
  while (i < len) {
    uint32_t cp = 0;
    int n = valid_seq(p + i, len - i, cp);
    if (n > 0) {
      out.append(data + i, static_cast<size_t>(n));
      i += static_cast<size_t>(n);
      continue;
    }
    append_utf8(out, REPLACEMENT_CHAR);
    // skip the lead byte plus any continuation bytes belonging to it
    ++i;
    while (i < len && (p[i] & 0xC0) == 0x80) ++i;
  }
  return out;
}

std::vector<uint32_t> decode_utf8(const std::string& s) {
  std::vector<uint32_t> cps;
  cps.reserve(s.size());
  const unsigned char* p = reinterpret_cast<const unsigned char*>(s.data());
  size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    int n = valid_seq(p + i, s.size() - i, cp);
    if (n == 0) { cps.push_back(REPLACEMENT_CHAR); ++i; continue; }
    cps.push_back(cp);
    i += static_cast<size_t>(n);
  }
  return cps;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = REPLACEMENT_CHAR;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

int utf8_width(const std::string& s) {
  int n = 0;
  for (unsigned char c : s) if ((c & 0xC0) != 0x80) ++n;
  return n;
}

int Line::width() const {
  int w = 0;
  for (const auto& sp : spans) w += utf8_width(sp.text);
  return w;
}

std::string Line::plain() const {
  std::string s;
  for (const auto& sp : spans) s += sp.text;
  return s;
}

bool Line::operator==(const Line& o) const {
  if (spans.size() != o.spans.size()) return false;
  for (size_t i = 0; i < spans.size(); ++i)
    if (spans[i].text != o.spans[i].text || !(spans[i].style == o.spans[i].style)) return false;
  return true;
}

Line line_from_text(const std::string& text, const Style& style) {
  Line l;
  l.spans.push_back(Span{text, style});
  return l;
}

std::vector<Line> lines_from_text(const std::string& text, const Style& style) {
  std::vector<Line> out;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(line_from_text(text.substr(start), style));
      break;
    }
    out.push_back(line_from_text(text.substr(start, nl - start), style));
    start = nl + 1;
  }
  return out;
}

Span join_spans(const std::vector<Span>& spans) {
  Span out;
  if (spans.empty()) return out;
  out.style = spans.front().style;
  for (const auto& sp : spans) out.text += sp.text;
  return out;
}
