#include "style.hpp"
#include <climits>

// xterm default values for the 16 palette entries
static const uint8_t kPalette[16][3] = {
  {0, 0, 0},       {128, 0, 0},     {0, 128, 0},     {128, 128, 0},
  {0, 0, 128},     {128, 0, 128},   {0, 128, 128},   {192, 192, 192},
  {128, 128, 128}, {255, 0, 0},     {0, 255, 0},     {255, 255, 0},
  {0, 0, 255},     {255, 0, 255},   {0, 255, 255},   {255, 255, 255},
};

uint32_t encode_color(const Color& c) {
  switch (c.kind) {
    case ColorKind::Reset: return 0;
    case ColorKind::Named: return static_cast<uint32_t>(c.index & 0x0F) + 1;
    case ColorKind::Indexed: return COLOR_TAG_INDEXED | c.index;
    case ColorKind::Rgb:
      return COLOR_TAG_RGB | (static_cast<uint32_t>(c.r) << 16) | (static_cast<uint32_t>(c.g) << 8) | c.b;
  }
  return 0;
}

Color decode_color(uint32_t v) {
  if (v >= 1 && v <= 16) return Color::named(static_cast<uint8_t>(v - 1));
  uint32_t tag = v & COLOR_TAG_MASK;
  if (tag == COLOR_TAG_INDEXED && (v & ~(COLOR_TAG_MASK | 0xFFu)) == 0)
    return Color::indexed(static_cast<uint8_t>(v & 0xFF));
  if (tag == COLOR_TAG_RGB && (v & ~(COLOR_TAG_MASK | 0xFFFFFFu)) == 0)
    return Color::rgb(static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v));
  return Color::reset();
}

uint32_t color_rgb(uint8_t r, uint8_t g, uint8_t b) { return encode_color(Color::rgb(r, g, b)); }
uint32_t color_indexed(uint8_t idx) { return encode_color(Color::indexed(idx)); }
uint32_t color_named(uint8_t n) { return encode_color(Color::named(n)); }

static void xterm_to_rgb(uint8_t idx, uint8_t& r, uint8_t& g, uint8_t& b) {
  if (idx < 16) { r = kPalette[idx][0]; g = kPalette[idx][1]; b = kPalette[idx][2]; return; }
  if (idx >= 232) {
    uint8_t v = static_cast<uint8_t>(8 + (idx - 232) * 10);
    r = g = b = v;
    return;
  }
  int n = idx - 16;
  auto level = [](int q) -> uint8_t { return q == 0 ? 0 : static_cast<uint8_t>(55 + q * 40); };
  r = level(n / 36);
  g = level((n / 6) % 6);
  b = level(n % 6);
}

void color_to_rgb(const Color& c, uint8_t& r, uint8_t& g, uint8_t& b) {
  switch (c.kind) {
    case ColorKind::Reset: r = g = b = 0; return;
    case ColorKind::Named: xterm_to_rgb(c.index & 0x0F, r, g, b); return;
    case ColorKind::Indexed: xterm_to_rgb(c.index, r, g, b); return;
    case ColorKind::Rgb: r = c.r; g = c.g; b = c.b; return;
  }
}

int nearest_named(const Color& c) {
  if (c.kind == ColorKind::Reset) return -1;
  if (c.kind == ColorKind::Named) return c.index & 0x0F;
  if (c.kind == ColorKind::Indexed && c.index < 16) return c.index;
  uint8_t r, g, b;
  color_to_rgb(c, r, g, b);
  int best = 0;
  long best_d = LONG_MAX;
  for (int i = 0; i < 16; ++i) {
    long dr = r - kPalette[i][0], dg = g - kPalette[i][1], db = b - kPalette[i][2];
    long d = dr * dr + dg * dg + db * db;
    if (d < best_d) { best_d = d; best = i; } // ties keep the lower index
  }
  return best;
}

uint8_t compact_color_code(const Color& c) {
  int n = nearest_named(c);
  return n < 0 ? 0 : static_cast<uint8_t>(n + 1);
}

Style patch_style(const Style& base, const Style& over) {
  Style s = base;
  if (!over.fg.is_reset()) s.fg = over.fg;
  if (!over.bg.is_reset()) s.bg = over.bg;
  s.mods = static_cast<uint16_t>((s.mods | over.mods) & MOD_ALL);
  return s;
}
