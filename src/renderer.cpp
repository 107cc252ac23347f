#include "renderer.hpp"
#include <algorithm>

Rect pane_area(int rows, int cols) { return Rect{1, 0, std::max(0, rows - 2), std::max(0, cols)}; }

Rect pane_body(const Rect& pane) {
  if (pane.height <= 1) return Rect{pane.row + pane.height, pane.col, 0, pane.width};
  return Rect{pane.row + 1, pane.col, pane.height - 1, pane.width};
}

std::string pin_icon_glyph(PinIcon icon) {
  switch (icon) {
    case PinIcon::Pin: return "^";
    case PinIcon::Terminal: return ">";
    case PinIcon::Code: return "#";
    case PinIcon::File: return "=";
    case PinIcon::Folder: return "/";
    case PinIcon::Star: return "*";
    case PinIcon::Heart: return "<3";
    case PinIcon::Bookmark: return "&";
    case PinIcon::Home: return "~";
    case PinIcon::Settings: return "%";
    case PinIcon::Globe: return "@";
    case PinIcon::Zap: return "!";
  }
  return "^";
}

static std::string clip(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if (static_cast<int>(s.size()) <= width) return s;
  return s.substr(0, static_cast<size_t>(width));
}

void Renderer::draw_tab_bar(ITerminal& term, const std::vector<TabBarEntry>& tabs, int cols) {
  term.clear_to_eol(0, 0);
  int col = 0;
  for (const auto& t : tabs) {
    if (col >= cols) break;
    std::string label = " ";
    if (t.pinned) label += pin_icon_glyph(t.pin_icon.value_or(PinIcon::Pin)) + " ";
    label += t.title + " ";
    label = clip(label, cols - col);
    if (t.active) term.draw_reversed(0, col, label);
    else if (t.color) term.draw_colored(0, col, label, kPairTabColorBase + static_cast<int>(*t.color));
    else term.draw_text(0, col, label);
    col += static_cast<int>(label.size());
    if (col < cols) { term.draw_colored(0, col, "|", kPairMuted); col++; }
  }
}

void Renderer::draw_pane(ITerminal& term, const PaneView& pane) {
  const Rect& r = pane.rect;
  if (r.empty()) return;
  std::string title = clip(" " + pane.title + " ", r.width);
  std::string fill(static_cast<size_t>(std::max(0, r.width - static_cast<int>(title.size()))), '-');
  if (pane.active) term.draw_reversed(r.row, r.col, title + fill);
  else {
    term.draw_text(r.row, r.col, title);
    term.draw_colored(r.row, r.col + static_cast<int>(title.size()), fill, kPairMuted);
  }
  Rect body = pane_body(r);
  if (pane.body == PaneView::Body::Surface) return;
  int pair = pane.body == PaneView::Body::Error ? kPairError
           : pane.body == PaneView::Body::Snapshot ? kPairMuted : 0;
  for (int i = 0; i < body.height && i < static_cast<int>(pane.lines.size()); ++i) {
    std::string line = clip(pane.lines[static_cast<size_t>(i)], body.width);
    if (pair) term.draw_colored(body.row + i, body.col, line, pair);
    else term.draw_text(body.row + i, body.col, line);
  }
}

void Renderer::draw_overlay(ITerminal& term, const OverlayView& overlay, int rows, int cols) {
  int content_w = static_cast<int>(overlay.title.size());
  for (const auto& it : overlay.items) content_w = std::max(content_w, static_cast<int>(it.size()) + 2);
  if (overlay.input) content_w = std::max(content_w, static_cast<int>(overlay.input->size()) + 2);
  int w = std::min(cols - 2, std::max(24, content_w + 4));
  int h = static_cast<int>(overlay.items.size()) + (overlay.input ? 1 : 0) + 2;
  h = std::min(h, rows - 2);
  if (w < 4 || h < 3) return;
  int top = std::max(1, (rows - h) / 2);
  int left = std::max(0, (cols - w) / 2);
  std::string edge = "+" + std::string(static_cast<size_t>(w - 2), '-') + "+";
  term.draw_text(top, left, edge);
  term.draw_text(top, left + 2, clip(" " + overlay.title + " ", w - 4));
  int row = top + 1;
  auto draw_row = [&](const std::string& text, bool selected) {
    std::string inner = clip(text, w - 4);
    inner += std::string(static_cast<size_t>(w - 4 - static_cast<int>(inner.size())), ' ');
    term.draw_text(row, left, "| ");
    if (selected) term.draw_reversed(row, left + 2, inner);
    else term.draw_text(row, left + 2, inner);
    term.draw_text(row, left + w - 2, " |");
    row++;
  };
  if (overlay.input) draw_row("> " + *overlay.input, false);
  for (size_t i = 0; i < overlay.items.size() && row < top + h - 1; ++i)
    draw_row(overlay.items[i], static_cast<int>(i) == overlay.selected);
  term.draw_text(row, left, edge);
}

void Renderer::render(ITerminal& term, const FrameView& frame) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) return;
  draw_tab_bar(term, frame.tabs, cols);
  for (const auto& p : frame.panes) draw_pane(term, p);
  if (frame.overlay) draw_overlay(term, *frame.overlay, rows, cols);

  std::string status = frame.command_mode ? ":" + frame.cmdline : frame.status;
  term.clear_to_eol(rows - 1, 0);
  term.draw_text(rows - 1, 0, clip(status, cols));
  if (frame.command_mode) {
    term.show_cursor(true);
    term.move_cursor(rows - 1, std::min(cols - 1, static_cast<int>(status.size())));
  } else {
    term.show_cursor(false);
  }
  term.refresh();
}
