#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * refresh() stages the application's frame; present() puts it on screen.
 * Native surfaces are composited between the two.
 */
#include <string>

struct TermSize { int rows; int cols; };

// Color pairs shared by all backends.
inline constexpr int kPairDefault = 2;
inline constexpr int kPairError = 3;
inline constexpr int kPairMuted = 4;
inline constexpr int kPairTabColorBase = 10; // + static_cast<int>(TabColor)

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_reversed(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool on) = 0;
  virtual void refresh() = 0;
  virtual void present() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
