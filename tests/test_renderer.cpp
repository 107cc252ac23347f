#include "headless_terminal.hpp"
#include "renderer.hpp"
#include <cassert>
#include <string>

static FrameView two_panes() {
  FrameView f;
  f.tabs.push_back(TabBarEntry{"Terminal 1", true, false, std::nullopt, std::nullopt});
  f.tabs.push_back(TabBarEntry{"docs", false, true, PinIcon::Star, TabColor::Green});
  Rect area = pane_area(24, 80);
  PaneView left;
  left.id = "a";
  left.title = "Terminal 1";
  left.rect = Rect{area.row, 0, area.height, 40};
  left.active = true;
  left.lines = {"$ ls", "a.txt"};
  PaneView right;
  right.id = "b";
  right.title = "example.com";
  right.rect = Rect{area.row, 40, area.height, 40};
  right.body = PaneView::Body::Surface;
  right.lines = {"never drawn"};
  f.panes = {left, right};
  f.status = "ready";
  return f;
}

static void test_frame_layout() {
  HeadlessTerminal term(24, 80);
  Renderer r;
  r.render(term, two_panes());

  assert(term.row(0).rfind(" Terminal 1 | * docs |", 0) == 0);
  assert(term.pair_at(0, 1) == -1);
  assert(term.pair_at(0, 12) == kPairMuted);
  assert(term.pair_at(0, 15) == kPairTabColorBase + static_cast<int>(TabColor::Green));

  // title rows: active pane reversed, inactive plain with a muted fill
  assert(term.row(1).rfind(" Terminal 1 ---", 0) == 0);
  assert(term.pair_at(1, 30) == -1);
  assert(term.row(1).substr(40, 13) == " example.com ");
  assert(term.pair_at(1, 41) == 0);
  assert(term.pair_at(1, 60) == kPairMuted);

  assert(term.row(2).rfind("$ ls", 0) == 0);
  assert(term.row(3).rfind("a.txt", 0) == 0);
  assert(term.find_row("never drawn") == -1);
  assert(term.row(2).substr(40) == std::string(40, ' '));

  assert(term.row(23).rfind("ready", 0) == 0);
  assert(!term.cursor_visible());
}

static void test_body_kinds() {
  HeadlessTerminal term(10, 30);
  FrameView f;
  PaneView err;
  err.title = "Web";
  err.rect = Rect{1, 0, 8, 30};
  err.body = PaneView::Body::Error;
  err.lines = {"renderer crashed", "https://example.com/a/very/long/path/that/is/clipped"};
  f.panes = {err};
  Renderer r;
  r.render(term, f);
  assert(term.row(2).rfind("renderer crashed", 0) == 0);
  assert(term.pair_at(2, 0) == kPairError);
  assert(term.row(3) == std::string("https://example.com/a/very/lon"));

  f.panes[0].body = PaneView::Body::Snapshot;
  f.panes[0].lines = {"frozen"};
  r.render(term, f);
  assert(term.pair_at(2, 0) == kPairMuted);
  assert(term.find_row("renderer") == -1);
}

static void test_overlay_and_command_line() {
  HeadlessTerminal term(24, 80);
  FrameView f = two_panes();
  f.overlay = OverlayView{"Split", {"Right: terminal", "Down: terminal"}, 1, std::nullopt};
  Renderer r;
  r.render(term, f);
  int title_row = term.find_row(" Split ");
  assert(title_row > 0);
  int down_row = term.find_row("Down: terminal");
  assert(down_row == title_row + 2);
  int col = static_cast<int>(term.row(down_row).find("Down"));
  assert(term.pair_at(down_row, col) == -1);
  int right_row = term.find_row("Right: terminal");
  assert(term.pair_at(right_row, static_cast<int>(term.row(right_row).find("Right"))) == 0);

  f.overlay = OverlayView{"Open URL", {}, -1, std::string("example.org")};
  f.command_mode = true;
  f.cmdline = "tabnew";
  r.render(term, f);
  assert(term.find_row("> example.org") > 0);
  assert(term.row(23).rfind(":tabnew", 0) == 0);
  assert(term.cursor_visible());
  assert(term.cursor_row() == 23);
  assert(term.cursor_col() == 7);
}

static void test_geometry_helpers() {
  assert(pane_area(24, 80) == (Rect{1, 0, 22, 80}));
  assert(pane_area(1, 10).height == 0);
  assert(pane_body(Rect{1, 0, 10, 20}) == (Rect{2, 0, 9, 20}));
  assert(pane_body(Rect{1, 0, 1, 20}).empty());
  assert(pin_icon_glyph(PinIcon::Globe) == "@");
}

int main() {
  test_frame_layout();
  test_body_kinds();
  test_overlay_and_command_line();
  test_geometry_helpers();
  return 0;
}
