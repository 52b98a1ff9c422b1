#include "style.hpp"
#include <cassert>
#include <cstdint>

static void check_codec() {
  assert(encode_color(Color::reset()) == 0);
  assert(decode_color(0).is_reset());

  for (uint8_t n = 0; n < 16; ++n) {
    uint32_t v = encode_color(Color::named(n));
    assert(v == static_cast<uint32_t>(n) + 1);
    assert(decode_color(v) == Color::named(n));
  }

  for (uint32_t i = 0; i < 256; ++i) {
    const Color c = Color::indexed(static_cast<uint8_t>(i));
    assert(encode_color(c) == (0x40000000u | i));
    assert(decode_color(0x40000000u | i) == c);
  }
  assert(encode_color(Color::indexed(200)) == 0x400000C8u);

  // the whole 24-bit space
  for (uint32_t rgb = 0; rgb <= 0xFFFFFFu; ++rgb) {
    const uint32_t v = 0x80000000u | rgb;
    const Color c = decode_color(v);
    assert(c.kind == ColorKind::Rgb);
    assert(c.r == (rgb >> 16) && c.g == ((rgb >> 8) & 0xFF) && c.b == (rgb & 0xFF));
    assert(encode_color(c) == v);
  }
  assert(encode_color(Color::rgb(0x12, 0x34, 0x56)) == 0x80123456u);

  // patterns outside the four forms decode to Reset
  assert(decode_color(17).is_reset());
  assert(decode_color(0xC0000001u).is_reset());
  assert(decode_color(0x40000100u).is_reset());
  assert(decode_color(0x81000000u).is_reset());
}

static void check_helpers() {
  assert(color_rgb(255, 0, 0) == 0x80FF0000u);
  assert(color_indexed(7) == 0x40000007u);
  assert(color_named(COLOR_NAMED_WHITE) == 16);
}

static void check_nearest() {
  assert(compact_color_code(Color::reset()) == 0x00);
  assert(compact_color_code(Color::named(COLOR_NAMED_RED)) == 0x02);
  assert(compact_color_code(Color::indexed(9)) == 0x0A);
  assert(compact_color_code(Color::rgb(250, 5, 5)) == 0x0A);       // light red
  assert(compact_color_code(Color::rgb(0, 0, 0)) == 0x01);         // black
  assert(compact_color_code(Color::rgb(255, 255, 255)) == 0x10);   // white
  assert(compact_color_code(Color::indexed(231)) == 0x10);         // cube corner 255,255,255
  assert(nearest_named(Color::indexed(232)) == COLOR_NAMED_BLACK); // 8,8,8
}

static void check_patch() {
  Style base;
  base.fg = Color::named(COLOR_NAMED_RED);
  base.bg = Color::named(COLOR_NAMED_BLUE);
  base.mods = MOD_BOLD;

  Style over;
  over.bg = Color::rgb(1, 2, 3);
  over.mods = MOD_ITALIC;

  Style s = patch_style(base, over);
  assert(s.fg == Color::named(COLOR_NAMED_RED));
  assert(s.bg == Color::rgb(1, 2, 3));
  assert(s.mods == (MOD_BOLD | MOD_ITALIC));

  assert(patch_style(base, Style{}) == base);
}

int main() {
  check_codec();
  check_helpers();
  check_nearest();
  check_patch();
  return 0;
}
