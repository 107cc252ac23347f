#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  screen_.assign(static_cast<size_t>(rows), std::string(static_cast<size_t>(cols), ' '));
  pairs_.assign(static_cast<size_t>(rows), std::vector<int>(static_cast<size_t>(cols), 0));
}

void HeadlessTerminal::clear() { resize(rows_, cols_); }

void HeadlessTerminal::put(int row, int col, const std::string& text, int pair) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    screen_[static_cast<size_t>(row)][static_cast<size_t>(c)] = text[i];
    pairs_[static_cast<size_t>(row)][static_cast<size_t>(c)] = pair;
  }
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = col < 0 ? 0 : col; c < cols_; ++c) {
    screen_[static_cast<size_t>(row)][static_cast<size_t>(c)] = ' ';
    pairs_[static_cast<size_t>(row)][static_cast<size_t>(c)] = 0;
  }
}

int HeadlessTerminal::find_row(const std::string& text) const {
  for (int r = 0; r < rows_; ++r)
    if (screen_[static_cast<size_t>(r)].find(text) != std::string::npos) return r;
  return -1;
}
