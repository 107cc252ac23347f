#pragma once
/*
 * PaneNode
 *
 * Purpose: immutable tagged-union node of a tab's pane tree.
 * Leaves are content (terminal/web surface/widget/editor); Split owns two children.
 * Nodes are shared as PanePtr (pointer to const) so a mutation only copies the
 * path from the root to the changed node; untouched subtrees keep their identity.
 */
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "types.hpp"

struct PaneNode;
using PanePtr = std::shared_ptr<const PaneNode>;

inline constexpr float kMinSplitRatio = 0.1f;
inline constexpr float kMaxSplitRatio = 0.9f;
float clamp_ratio(float ratio);

struct TerminalContent {
  std::optional<std::string> cwd;
  TerminalViewMode view_mode = TerminalViewMode::Classic;
};

struct WebSurfaceContent {
  std::string url;
};

struct WidgetContent {
  std::string widget_type;
  nlohmann::json config; // opaque to the core, null when absent
};

struct EditorContent {
  std::string file_path;
  std::optional<std::string> language;
  bool read_only = false;
};

struct SplitContent {
  SplitDirection direction = SplitDirection::Vertical;
  float ratio = 0.5f; // first child's share
  PanePtr first;
  PanePtr second;
};

using PaneContent = std::variant<TerminalContent, WebSurfaceContent, WidgetContent, EditorContent>;

// Content plus title for a leaf that has not been given an id yet.
struct PaneSpec {
  std::string title;
  PaneContent content;
};

struct PaneNode {
  // Order matches the alternatives of `body`.
  enum class Kind { Terminal, WebSurface, Widget, Editor, Split };

  std::string id;
  std::string title;
  std::variant<TerminalContent, WebSurfaceContent, WidgetContent, EditorContent, SplitContent> body;

  Kind kind() const { return static_cast<Kind>(body.index()); }
  bool is_split() const { return kind() == Kind::Split; }
  bool is_leaf() const { return !is_split(); }

  const TerminalContent* terminal() const { return std::get_if<TerminalContent>(&body); }
  const WebSurfaceContent* web_surface() const { return std::get_if<WebSurfaceContent>(&body); }
  const WidgetContent* widget() const { return std::get_if<WidgetContent>(&body); }
  const EditorContent* editor() const { return std::get_if<EditorContent>(&body); }
  const SplitContent* split() const { return std::get_if<SplitContent>(&body); }
};

std::string to_string(PaneNode::Kind k);
PaneNode::Kind kind_of(const PaneContent& c);

PanePtr make_terminal_pane(std::string id, std::string title, std::optional<std::string> cwd = std::nullopt,
                           TerminalViewMode mode = TerminalViewMode::Classic);
PanePtr make_web_pane(std::string id, std::string title, std::string url);
PanePtr make_widget_pane(std::string id, std::string title, std::string widget_type, nlohmann::json config = nullptr);
PanePtr make_editor_pane(std::string id, std::string title, std::string file_path,
                         std::optional<std::string> language = std::nullopt, bool read_only = false);
PanePtr make_split_pane(std::string id, SplitDirection dir, PanePtr first, PanePtr second, float ratio = 0.5f);
PanePtr make_leaf(std::string id, const PaneSpec& spec);

// Copy of `leaf` with a different content payload but the same id and title.
PanePtr with_content(const PaneNode& leaf, PaneContent content);
