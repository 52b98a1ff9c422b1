#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, modes, cell output, cursor, input).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "cell_buffer.hpp"
#include "event.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  // False when attached to something that cannot switch modes (pipe, file).
  virtual bool interactive() const = 0;
  virtual void clear() = 0;
  virtual void draw_cells(int row, int col, const Cell* cells, int count) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  virtual bool set_raw(bool on, std::string& err) = 0;
  virtual bool set_alt_screen(bool on, std::string& err) = 0;
  // Waits up to timeout_ms for one input event.
  virtual bool read_event(Event& out, int timeout_ms) = 0;
};
