#pragma once
/*
 * ScreenGuard
 *
 * Purpose: own the ncurses screen for the lifetime of main.
 * Usage: construct before NcursesTerminal; check ok(); destructor restores the tty.
 * Note: shells run on their own ptys, so the screen stays raw for the whole run.
 */
#include <ncurses.h>
#include <string>

class ScreenGuard {
public:
  ScreenGuard();
  ~ScreenGuard();
  ScreenGuard(const ScreenGuard&) = delete;
  ScreenGuard& operator=(const ScreenGuard&) = delete;

  bool ok() const { return screen_ != nullptr; }
  const std::string& error() const { return error_; }

private:
  SCREEN* screen_ = nullptr;
  std::string error_;
};
