#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and offscreen sessions.
 * Note: records every mode switch so callers can assert on idempotence.
 */
#include <deque>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int cols, int rows, bool interactive);

  TermSize getSize() const override { return {screen_.height(), screen_.width()}; }
  bool interactive() const override { return interactive_; }
  void clear() override;
  void draw_cells(int row, int col, const Cell* cells, int count) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { ++refresh_count_; }
  bool set_raw(bool on, std::string& err) override;
  bool set_alt_screen(bool on, std::string& err) override;
  bool read_event(Event& out, int timeout_ms) override;

  void resize(int cols, int rows) { screen_.resize(cols, rows); }
  // Scripted input returned by read_event.
  void feed(const Event& e) { input_.push_back(e); }

  const CellBuffer& screen() const { return screen_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  bool raw() const { return raw_; }
  bool alt_screen() const { return alt_; }
  int mode_switches() const { return mode_switches_; }
  int refresh_count() const { return refresh_count_; }

private:
  CellBuffer screen_;
  bool interactive_;
  bool raw_ = false;
  bool alt_ = false;
  bool cursor_visible_ = true;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int mode_switches_ = 0;
  int refresh_count_ = 0;
  std::deque<Event> input_;
};
