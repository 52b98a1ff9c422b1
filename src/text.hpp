#pragma once
/*
 * Text
 *
 * Purpose: owned styled text runs (Span) and lines (Line).
 * Note: all text is stored as valid UTF-8; every codepoint takes one cell.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "style.hpp"

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

struct Span {
  std::string text;
  Style style;
};

struct Line {
  std::vector<Span> spans;

  int width() const;
  std::string plain() const;
  bool operator==(const Line& o) const;
};

// Copy `len` bytes into owned UTF-8, one U+FFFD per invalid sequence.
std::string sanitize_utf8(const char* data, size_t len);
std::vector<uint32_t> decode_utf8(const std::string& s);
void append_utf8(std::string& out, uint32_t cp);
int utf8_width(const std::string& s);

// One line per '\n' separated segment, all under `style`.
std::vector<Line> lines_from_text(const std::string& text, const Style& style);
Line line_from_text(const std::string& text, const Style& style);

// Texts concatenated into one run under the first span's style.
Span join_spans(const std::vector<Span>& spans);
