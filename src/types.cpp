#include "types.hpp"
#include <array>
#include <utility>

static constexpr std::array<std::pair<TabColor, const char*>, 8> kColors{{
  {TabColor::Cyan, "cyan"}, {TabColor::Green, "green"}, {TabColor::Yellow, "yellow"},
  {TabColor::Orange, "orange"}, {TabColor::Red, "red"}, {TabColor::Magenta, "magenta"},
  {TabColor::Blue, "blue"}, {TabColor::White, "white"},
}};

static constexpr std::array<std::pair<PinIcon, const char*>, 12> kIcons{{
  {PinIcon::Pin, "pin"}, {PinIcon::Terminal, "terminal"}, {PinIcon::Code, "code"},
  {PinIcon::File, "file"}, {PinIcon::Folder, "folder"}, {PinIcon::Star, "star"},
  {PinIcon::Heart, "heart"}, {PinIcon::Bookmark, "bookmark"}, {PinIcon::Home, "home"},
  {PinIcon::Settings, "settings"}, {PinIcon::Globe, "globe"}, {PinIcon::Zap, "zap"},
}};

std::string to_string(SplitDirection d) { return d == SplitDirection::Vertical ? "vertical" : "horizontal"; }
std::string to_string(TerminalViewMode m) { return m == TerminalViewMode::Blocks ? "blocks" : "classic"; }

std::string to_string(TabColor c) {
  for (const auto& [k, name] : kColors) if (k == c) return name;
  return "white";
}

std::string to_string(PinIcon i) {
  for (const auto& [k, name] : kIcons) if (k == i) return name;
  return "pin";
}

std::optional<SplitDirection> parse_split_direction(const std::string& s) {
  if (s == "vertical") return SplitDirection::Vertical;
  if (s == "horizontal") return SplitDirection::Horizontal;
  return std::nullopt;
}

std::optional<TerminalViewMode> parse_view_mode(const std::string& s) {
  if (s == "classic") return TerminalViewMode::Classic;
  if (s == "blocks") return TerminalViewMode::Blocks;
  return std::nullopt;
}

std::optional<TabColor> parse_tab_color(const std::string& s) {
  for (const auto& [k, name] : kColors) if (s == name) return k;
  return std::nullopt;
}

std::optional<PinIcon> parse_pin_icon(const std::string& s) {
  for (const auto& [k, name] : kIcons) if (s == name) return k;
  return std::nullopt;
}
