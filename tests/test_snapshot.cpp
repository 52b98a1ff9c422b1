#include "snapshot.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  CellBuffer buf(3, 2);
  Style st;
  st.fg = Color::rgb(250, 5, 5);
  st.bg = Color::indexed(4);
  st.mods = MOD_BOLD | MOD_UNDERLINE;
  buf.set(0, 0, 'x', st);
  buf.set(2, 1, 0x2502, Style{});
  buf.set(1, 1, '\xE9', Style{}); // U+00E9

  assert(snapshot_text(buf) == "x  \n \xC3\xA9\xE2\x94\x82");

  assert(snapshot_styles(buf) ==
         "0A050005 00000000 00000000\n"
         "00000000 00000000 00000000");

  std::string ex = snapshot_styles_ex(buf);
  assert(ex.substr(0, 20) == "80FA0505400000040005");
  assert(ex.find('\n') == 3 * 20 + 2);

  std::vector<CellRecord> cells(6);
  assert(snapshot_cells(buf, cells.data(), cells.size()) == 6);
  assert(cells[0].codepoint == 'x');
  assert(cells[0].fg == 0x80FA0505u);
  assert(cells[0].bg == 0x40000004u);
  assert(cells[0].mods == (MOD_BOLD | MOD_UNDERLINE));
  assert(cells[5].codepoint == 0x2502);

  // short buffers get the leading cells and the full count
  CellRecord two[2] = {};
  assert(snapshot_cells(buf, two, 2) == 6);
  assert(two[0].codepoint == 'x' && two[1].codepoint == ' ');
  assert(snapshot_cells(buf, nullptr, 0) == 6);

  CellBuffer empty;
  assert(snapshot_text(empty).empty());
  assert(snapshot_styles(empty).empty());
  assert(snapshot_cells(empty, nullptr, 0) == 0);
  return 0;
}
