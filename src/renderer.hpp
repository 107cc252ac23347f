#pragma once
/*
 * Renderer
 *
 * Purpose: draw one workspace frame: tab bar, pane titles and bodies,
 * overlay box, status / command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a FrameView snapshot from Workspace.
 * Native surfaces are not drawn here; their slot is left blank for the host.
 */
#include <optional>
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"

struct TabBarEntry {
  std::string title;
  bool active = false;
  bool pinned = false;
  std::optional<PinIcon> pin_icon;
  std::optional<TabColor> color;
};

struct PaneView {
  enum class Body { Text, Surface, Snapshot, Error };
  std::string id;
  std::string title;
  Rect rect; // title row included
  bool active = false;
  Body body = Body::Text;
  std::vector<std::string> lines;
};

struct OverlayView {
  std::string title;
  std::vector<std::string> items;
  int selected = -1;
  std::optional<std::string> input; // text field (URL popover)
};

struct FrameView {
  std::vector<TabBarEntry> tabs;
  std::vector<PaneView> panes;
  std::optional<OverlayView> overlay;
  std::string status;
  bool command_mode = false;
  std::string cmdline;
};

// Pane area of a screen: everything between the tab bar and the status line.
Rect pane_area(int rows, int cols);
// Body of a pane below its title row; native surfaces are placed here.
Rect pane_body(const Rect& pane);
std::string pin_icon_glyph(PinIcon icon);

class Renderer {
public:
  void render(ITerminal& term, const FrameView& frame);
private:
  void draw_tab_bar(ITerminal& term, const std::vector<TabBarEntry>& tabs, int cols);
  void draw_pane(ITerminal& term, const PaneView& pane);
  void draw_overlay(ITerminal& term, const OverlayView& overlay, int rows, int cols);
};
