#include "ncurses_terminal.hpp"
#include <algorithm>
#include <chrono>
#include <term.h>

NcursesTerminal::NcursesTerminal(std::unique_ptr<CursesScreen> screen) : screen_(std::move(screen)) {
  if (has_colors()) {
    start_color();
    use_default_colors();
  }
}

NcursesTerminal::~NcursesTerminal() {
  curs_set(1);
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::curses_color(const Color& c) const {
  int n = COLORS;
  switch (c.kind) {
    case ColorKind::Reset: return -1;
    case ColorKind::Named: return static_cast<short>(c.index < n ? c.index : c.index % 8);
    case ColorKind::Indexed:
      if (c.index < n) return c.index;
      break;
    case ColorKind::Rgb:
      if (n >= 256) {
        auto q = [](uint8_t v) { return (v * 5 + 127) / 255; };
        return static_cast<short>(16 + 36 * q(c.r) + 6 * q(c.g) + q(c.b));
      }
      break;
  }
  int named = nearest_named(c);
  return static_cast<short>(named < n ? named : named % 8);
}

short NcursesTerminal::pair_for(const Style& st) {
  if (!has_colors()) return 0;
  std::pair<short, short> key{curses_color(st.fg), curses_color(st.bg)};
  if (key.first == -1 && key.second == -1) return 0;
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0; // pair table exhausted: default colors
  short id = next_pair_++;
  init_pair(id, key.first, key.second);
  pairs_.emplace(key, id);
  return id;
}

static attr_t attrs_for(uint16_t mods) {
  attr_t a = A_NORMAL;
  if (mods & MOD_BOLD) a |= A_BOLD;
  if (mods & MOD_DIM) a |= A_DIM;
  if (mods & MOD_ITALIC) a |= A_ITALIC;
  if (mods & MOD_UNDERLINE) a |= A_UNDERLINE;
  if (mods & MOD_REVERSED) a |= A_REVERSE;
  if (mods & (MOD_SLOWBLINK | MOD_RAPIDBLINK)) a |= A_BLINK;
  if (mods & MOD_HIDDEN) a |= A_INVIS;
  return a;
}

void NcursesTerminal::draw_cells(int row, int col, const Cell* cells, int count) {
  std::string glyph;
  for (int i = 0; i < count; ++i) {
    const Cell& c = cells[i];
    glyph.clear();
    append_utf8(glyph, c.codepoint);
    attr_set(attrs_for(c.style.mods), pair_for(c.style), nullptr);
    mvaddnstr(row, col + i, glyph.c_str(), static_cast<int>(glyph.size()));
  }
  attr_set(A_NORMAL, 0, nullptr);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

bool NcursesTerminal::set_raw(bool on, std::string& err) {
  int rc = on ? raw() : noraw();
  if (rc == ERR) { err = on ? "raw() failed" : "noraw() failed"; return false; }
  if (!on) cbreak();
  return true;
}

bool NcursesTerminal::set_alt_screen(bool on, std::string& err) {
  const char* cap = on ? enter_ca_mode : exit_ca_mode;
  if (!cap || cap == reinterpret_cast<const char*>(-1)) {
    err = "terminal has no alternate screen capability";
    return false;
  }
  putp(cap);
  fflush(stdout);
  clearok(curscr, TRUE);
  return true;
}

bool NcursesTerminal::read_event(Event& out, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    timeout(static_cast<int>(std::max<long long>(0, left)));
    int ch = getch();
    if (ch == ERR) return input_.flush(out);
    if (ch == KEY_RESIZE) {
      TermSize sz = getSize();
      input_.reset();
      out = Event::resize_event(sz.cols, sz.rows);
      return true;
    }
    if (ch == KEY_MOUSE) {
      MEVENT me;
      if (getmouse(&me) == OK && Input::translateMouse(me, out)) return true;
      continue;
    }
    if (input_.consume(ch, out)) return true;
    // a prefix is pending: give its continuation a short window
    if (input_.pending()) deadline = std::max(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(get_escdelay()));
    if (left <= 0 && !input_.pending()) return false;
  }
}

std::unique_ptr<ITerminal> open_live_terminal(std::string& err) {
  auto screen = std::make_unique<CursesScreen>();
  if (!screen->ok()) {
    err = screen->error();
    return nullptr;
  }
  return std::make_unique<NcursesTerminal>(std::move(screen));
}
