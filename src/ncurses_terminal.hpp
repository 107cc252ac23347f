#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input mode.
 * Note: initialization/teardown is owned by ScreenGuard.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool on) override;
  void refresh() override;
  void present() override;
  void clear_to_eol(int row, int col) override;
  // Waits up to timeout_ms for a key; ERR when none arrived.
  int read_key(int timeout_ms);
private:
  void put(int row, int col, const std::string& text);
};
