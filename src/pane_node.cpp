#include "pane_node.hpp"
#include <algorithm>

float clamp_ratio(float ratio) {
  if (!(ratio == ratio)) return 0.5f; // NaN
  return std::clamp(ratio, kMinSplitRatio, kMaxSplitRatio);
}

std::string to_string(PaneNode::Kind k) {
  switch (k) {
    case PaneNode::Kind::Terminal: return "terminal";
    case PaneNode::Kind::WebSurface: return "webview";
    case PaneNode::Kind::Widget: return "widget";
    case PaneNode::Kind::Editor: return "editor";
    case PaneNode::Kind::Split: return "split";
  }
  return "terminal";
}

PaneNode::Kind kind_of(const PaneContent& c) {
  return static_cast<PaneNode::Kind>(c.index());
}

static PanePtr make_node(std::string id, std::string title, decltype(PaneNode::body) body) {
  auto n = std::make_shared<PaneNode>();
  n->id = std::move(id);
  n->title = std::move(title);
  n->body = std::move(body);
  return n;
}

PanePtr make_terminal_pane(std::string id, std::string title, std::optional<std::string> cwd, TerminalViewMode mode) {
  return make_node(std::move(id), std::move(title), TerminalContent{std::move(cwd), mode});
}

PanePtr make_web_pane(std::string id, std::string title, std::string url) {
  return make_node(std::move(id), std::move(title), WebSurfaceContent{std::move(url)});
}

PanePtr make_widget_pane(std::string id, std::string title, std::string widget_type, nlohmann::json config) {
  return make_node(std::move(id), std::move(title), WidgetContent{std::move(widget_type), std::move(config)});
}

PanePtr make_editor_pane(std::string id, std::string title, std::string file_path,
                         std::optional<std::string> language, bool read_only) {
  return make_node(std::move(id), std::move(title), EditorContent{std::move(file_path), std::move(language), read_only});
}

PanePtr make_split_pane(std::string id, SplitDirection dir, PanePtr first, PanePtr second, float ratio) {
  return make_node(std::move(id), std::string(), SplitContent{dir, clamp_ratio(ratio), std::move(first), std::move(second)});
}

PanePtr make_leaf(std::string id, const PaneSpec& spec) {
  return with_content(PaneNode{std::move(id), spec.title, TerminalContent{}}, spec.content);
}

PanePtr with_content(const PaneNode& leaf, PaneContent content) {
  auto n = std::make_shared<PaneNode>();
  n->id = leaf.id;
  n->title = leaf.title;
  std::visit([&](auto&& c) { n->body = std::move(c); }, std::move(content));
  return n;
}
