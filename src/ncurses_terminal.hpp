#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input mode.
 * Note: owns the CursesScreen, so the terminal is restored when this is destroyed.
 */
#include <map>
#include <memory>
#include <utility>
#include "curses_screen.hpp"
#include "input.hpp"
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(std::unique_ptr<CursesScreen> screen);
  ~NcursesTerminal() override;
  TermSize getSize() const override;
  bool interactive() const override { return true; }
  void clear() override;
  void draw_cells(int row, int col, const Cell* cells, int count) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  bool set_raw(bool on, std::string& err) override;
  bool set_alt_screen(bool on, std::string& err) override;
  bool read_event(Event& out, int timeout_ms) override;
private:
  short pair_for(const Style& st);
  short curses_color(const Color& c) const;
  std::unique_ptr<CursesScreen> screen_;
  std::map<std::pair<short, short>, short> pairs_;
  short next_pair_ = 1;
  Input input_;
};

// Live terminal on the controlling tty; nullptr with `err` set when unavailable.
std::unique_ptr<ITerminal> open_live_terminal(std::string& err);
