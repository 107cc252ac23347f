#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that draws into an in-memory grid, for renderer tests.
 * Each cell remembers its color pair (0 = plain, -1 = reversed).
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, 0); }
  void draw_reversed(int row, int col, const std::string& text) override { put(row, col, text, -1); }
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override { put(row, col, text, color_pair_id); }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void show_cursor(bool on) override { cursor_visible_ = on; }
  void refresh() override { ++refreshes_; }
  void present() override { ++presents_; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  const std::string& row(int r) const { return screen_[static_cast<size_t>(r)]; }
  int pair_at(int r, int c) const { return pairs_[static_cast<size_t>(r)][static_cast<size_t>(c)]; }
  // Row index of the first row containing `text`, -1 when absent.
  int find_row(const std::string& text) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int presents() const { return presents_; }

private:
  void put(int row, int col, const std::string& text, int pair);

  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<std::vector<int>> pairs_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refreshes_ = 0;
  int presents_ = 0;
};
