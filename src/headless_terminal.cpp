#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int cols, int rows, bool interactive)
  : screen_(cols, rows), interactive_(interactive) {}

void HeadlessTerminal::clear() { screen_.reset(); }

void HeadlessTerminal::draw_cells(int row, int col, const Cell* cells, int count) {
  for (int i = 0; i < count; ++i) {
    if (!screen_.contains(col + i, row)) continue;
    screen_.at(col + i, row) = cells[i];
  }
}

void HeadlessTerminal::move_cursor(int row, int col) {
  cursor_row_ = row;
  cursor_col_ = col;
}

bool HeadlessTerminal::set_raw(bool on, std::string& err) {
  if (!interactive_) { err = "raw mode unavailable: not an interactive terminal"; return false; }
  raw_ = on;
  ++mode_switches_;
  return true;
}

bool HeadlessTerminal::set_alt_screen(bool on, std::string& err) {
  if (!interactive_) { err = "alternate screen unavailable: not an interactive terminal"; return false; }
  alt_ = on;
  ++mode_switches_;
  return true;
}

bool HeadlessTerminal::read_event(Event& out, int /*timeout_ms*/) {
  if (input_.empty()) return false;
  out = input_.front();
  input_.pop_front();
  return true;
}
