#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Rect/SplitDirection/colors).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <optional>
#include <string>

// Cell rectangle. row/col are the y/x origin in absolute screen cells.
struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool empty() const { return height <= 0 || width <= 0; }
  bool operator==(const Rect&) const = default;
};

// Where a hidden native surface is parked.
inline constexpr int kOffscreenOrigin = -10000;
inline Rect offscreen_rect(const Rect& r) { return Rect{kOffscreenOrigin, kOffscreenOrigin, r.height, r.width}; }
inline bool is_offscreen(const Rect& r) { return r.row <= kOffscreenOrigin && r.col <= kOffscreenOrigin; }

// vertical = side by side (divider is vertical), horizontal = stacked.
enum class SplitDirection { Horizontal, Vertical };

enum class TerminalViewMode { Classic, Blocks };

enum class TabColor { Cyan, Green, Yellow, Orange, Red, Magenta, Blue, White };

enum class PinIcon { Pin, Terminal, Code, File, Folder, Star, Heart, Bookmark, Home, Settings, Globe, Zap };

std::string to_string(SplitDirection d);
std::string to_string(TerminalViewMode m);
std::string to_string(TabColor c);
std::string to_string(PinIcon i);
std::optional<SplitDirection> parse_split_direction(const std::string& s);
std::optional<TerminalViewMode> parse_view_mode(const std::string& s);
std::optional<TabColor> parse_tab_color(const std::string& s);
std::optional<PinIcon> parse_pin_icon(const std::string& s);
