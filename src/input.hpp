#pragma once
#include <cstdint>
#include <ncurses.h>
#include "event.hpp"
/*
 * Input
 *
 * Purpose: turn raw curses key codes into Events with minimal state.
 * Extend: ESC prefix becomes ALT; multi-byte UTF-8 input is reassembled.
 */

class Input {
public:
  // True when `out` holds a completed event.
  bool consume(int ch, Event& out);
  // Read timed out: a lone pending ESC becomes an Esc key.
  bool flush(Event& out);
  bool pending() const;
  void reset();
  static bool translateMouse(const MEVENT& me, Event& out);
private:
  bool emit(KeyCode code, uint32_t ch, uint8_t mods, Event& out);
  bool pending_esc_ = false;
  uint32_t utf8_cp_ = 0;
  int utf8_left_ = 0;
};
