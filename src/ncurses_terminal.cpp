#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(kPairDefault, -1, bg);
    init_pair(kPairError, COLOR_RED, bg);
    init_pair(kPairMuted, COLOR_BLUE, bg);
    // Same order as TabColor; there is no orange in the 8-color palette.
    const short palette[] = {COLOR_CYAN, COLOR_GREEN, COLOR_YELLOW, COLOR_YELLOW,
                             COLOR_RED, COLOR_MAGENTA, COLOR_BLUE, COLOR_WHITE};
    for (int i = 0; i < 8; ++i) init_pair(static_cast<short>(kPairTabColorBase + i), palette[i], bg);
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::put(int row, int col, const std::string& text) {
  TermSize sz = get_size();
  if (row < 0 || row >= sz.rows || col >= sz.cols || text.empty()) return;
  int skip = col < 0 ? -col : 0;
  if (skip >= static_cast<int>(text.size())) return;
  int len = std::min(static_cast<int>(text.size()) - skip, sz.cols - std::max(col, 0));
  mvaddnstr(row, std::max(col, 0), text.c_str() + skip, len);
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairDefault));
  put(row, col, text);
  if (has_colors()) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  put(row, col, text);
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  put(row, col, text);
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool on) { curs_set(on ? 1 : 0); }

void NcursesTerminal::refresh() { wnoutrefresh(stdscr); }

void NcursesTerminal::present() { doupdate(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  return getch();
}
