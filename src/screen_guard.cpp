#include "screen_guard.hpp"
#include <clocale>
#include <cstdlib>
#include <cstdio>

ScreenGuard::ScreenGuard() {
  std::setlocale(LC_ALL, "");
  // newterm reports failure instead of exiting like initscr.
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* term = std::getenv("TERM");
    error_ = std::string("can not initialize terminal ") + (term ? term : "(TERM unset)");
    return;
  }
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  curs_set(0);
}

ScreenGuard::~ScreenGuard() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
}
