#pragma once
/*
 * CursesScreen
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: check ok() after construction; destructor restores the terminal.
 * Note: manages terminal modes (noecho/keypad/mouse), not rendering.
 */
#include <string>

struct screen;

class CursesScreen {
public:
  CursesScreen();
  ~CursesScreen();
  CursesScreen(const CursesScreen&) = delete;
  CursesScreen& operator=(const CursesScreen&) = delete;

  bool ok() const { return screen_ != nullptr; }
  const std::string& error() const { return error_; }

private:
  struct screen* screen_ = nullptr;
  std::string error_;
};
