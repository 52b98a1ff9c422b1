#include "curses_screen.hpp"
#include <locale.h>
#include <ncurses.h>
#include <unistd.h>

CursesScreen::CursesScreen() {
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    error_ = "stdin/stdout is not a tty";
    return;
  }
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    error_ = "newterm failed (check TERM)";
    return;
  }
  set_term(screen_);
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
  mouseinterval(0);
}

CursesScreen::~CursesScreen() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
}
