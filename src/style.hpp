#pragma once
/*
 * Style
 *
 * Purpose: color/modifier values and their fixed-width integer encoding.
 * Encoding: 0 = Reset, 1..16 = Named(0..15), 0x40000000|idx = Indexed,
 *           0x80000000|rrggbb = Rgb. Any other bit pattern decodes to Reset.
 */
#include <cstdint>

enum class ColorKind : uint8_t { Reset, Named, Indexed, Rgb };

// Named palette order (index 0..15)
enum NamedColor : uint8_t {
  COLOR_NAMED_BLACK = 0, COLOR_NAMED_RED, COLOR_NAMED_GREEN, COLOR_NAMED_YELLOW,
  COLOR_NAMED_BLUE, COLOR_NAMED_MAGENTA, COLOR_NAMED_CYAN, COLOR_NAMED_GRAY,
  COLOR_NAMED_DARKGRAY, COLOR_NAMED_LIGHTRED, COLOR_NAMED_LIGHTGREEN, COLOR_NAMED_LIGHTYELLOW,
  COLOR_NAMED_LIGHTBLUE, COLOR_NAMED_LIGHTMAGENTA, COLOR_NAMED_LIGHTCYAN, COLOR_NAMED_WHITE
};

enum Modifier : uint16_t {
  MOD_BOLD       = 1 << 0,
  MOD_ITALIC     = 1 << 1,
  MOD_UNDERLINE  = 1 << 2,
  MOD_DIM        = 1 << 3,
  MOD_CROSSED    = 1 << 4,
  MOD_REVERSED   = 1 << 5,
  MOD_RAPIDBLINK = 1 << 6,
  MOD_SLOWBLINK  = 1 << 7,
  MOD_HIDDEN     = 1 << 8,
};
constexpr uint16_t MOD_ALL = 0x01FF;

constexpr uint32_t COLOR_TAG_MASK    = 0xC0000000u;
constexpr uint32_t COLOR_TAG_INDEXED = 0x40000000u;
constexpr uint32_t COLOR_TAG_RGB     = 0x80000000u;

struct Color {
  ColorKind kind = ColorKind::Reset;
  uint8_t index = 0; // Named: 0..15, Indexed: 0..255
  uint8_t r = 0, g = 0, b = 0;

  static Color reset() { return Color{}; }
  static Color named(uint8_t n) { Color c; c.kind = ColorKind::Named; c.index = n & 0x0F; return c; }
  static Color indexed(uint8_t i) { Color c; c.kind = ColorKind::Indexed; c.index = i; return c; }
  static Color rgb(uint8_t r, uint8_t g, uint8_t b) { Color c; c.kind = ColorKind::Rgb; c.r = r; c.g = g; c.b = b; return c; }

  bool is_reset() const { return kind == ColorKind::Reset; }
  bool operator==(const Color&) const = default;
};

struct Style {
  Color fg;
  Color bg;
  uint16_t mods = 0;
  bool operator==(const Style&) const = default;
};

uint32_t encode_color(const Color& c);
Color decode_color(uint32_t v);

uint32_t color_rgb(uint8_t r, uint8_t g, uint8_t b);
uint32_t color_indexed(uint8_t idx);
uint32_t color_named(uint8_t n);

// Approximate 24-bit value of any color (Reset yields black).
void color_to_rgb(const Color& c, uint8_t& r, uint8_t& g, uint8_t& b);
// Nearest palette index 0..15; -1 for Reset.
int nearest_named(const Color& c);
// 0x00 for Reset, otherwise 0x01..0x10 for the nearest Named color.
uint8_t compact_color_code(const Color& c);

// Lays `over` on top of `base`: Reset channels inherit, modifiers are OR-ed.
Style patch_style(const Style& base, const Style& over);
