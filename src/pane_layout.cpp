#include "pane_layout.hpp"
#include <algorithm>
#include <unordered_set>

static int clamp_split(int total, float ratio) {
  if (total <= 1) return total;
  int primary = static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

static void collect_empty(const PaneNode& node, const Rect& area, std::vector<PaneRect>& out) {
  if (const SplitContent* s = node.split()) {
    if (s->first) collect_empty(*s->first, Rect{area.row, area.col, 0, 0}, out);
    if (s->second) collect_empty(*s->second, Rect{area.row, area.col, 0, 0}, out);
    return;
  }
  out.push_back(PaneRect{node.id, Rect{area.row, area.col, 0, 0}});
}

void collect_layout(const PaneNode& node, const Rect& area, std::vector<PaneRect>& out) {
  if (area.empty()) { collect_empty(node, area, out); return; }
  const SplitContent* s = node.split();
  if (!s) {
    out.push_back(PaneRect{node.id, area});
    return;
  }
  if (s->direction == SplitDirection::Vertical) {
    int left_w = clamp_split(area.width, s->ratio);
    Rect left{area.row, area.col, area.height, left_w};
    Rect right{area.row, area.col + left_w, area.height, area.width - left_w};
    if (s->first) collect_layout(*s->first, left, out);
    if (s->second) collect_layout(*s->second, right, out);
  } else {
    int top_h = clamp_split(area.height, s->ratio);
    Rect top{area.row, area.col, top_h, area.width};
    Rect bottom{area.row + top_h, area.col, area.height - top_h, area.width};
    if (s->first) collect_layout(*s->first, top, out);
    if (s->second) collect_layout(*s->second, bottom, out);
  }
}

PanePtr find_pane(const PanePtr& root, const std::string& id) {
  if (!root) return nullptr;
  if (root->id == id) return root;
  if (const SplitContent* s = root->split()) {
    if (auto hit = find_pane(s->first, id)) return hit;
    return find_pane(s->second, id);
  }
  return nullptr;
}

PanePtr find_parent_split(const PanePtr& root, const std::string& id) {
  const SplitContent* s = root ? root->split() : nullptr;
  if (!s) return nullptr;
  if ((s->first && s->first->id == id) || (s->second && s->second->id == id)) return root;
  if (auto hit = find_parent_split(s->first, id)) return hit;
  return find_parent_split(s->second, id);
}

static PanePtr with_children(const PaneNode& split, PanePtr first, PanePtr second, float ratio) {
  const SplitContent& s = *split.split();
  auto n = std::make_shared<PaneNode>();
  n->id = split.id;
  n->title = split.title;
  n->body = SplitContent{s.direction, ratio, std::move(first), std::move(second)};
  return n;
}

PanePtr replace_pane(const PanePtr& root, const std::string& target_id, PanePtr replacement) {
  if (!root) return root;
  if (root->id == target_id) return replacement;
  const SplitContent* s = root->split();
  if (!s) return root;
  PanePtr first = replace_pane(s->first, target_id, replacement);
  if (first != s->first) return with_children(*root, std::move(first), s->second, s->ratio);
  PanePtr second = replace_pane(s->second, target_id, replacement);
  if (second != s->second) return with_children(*root, s->first, std::move(second), s->ratio);
  return root;
}

PanePtr split_pane(const PanePtr& root, const std::string& target_id, SplitDirection dir,
                   PanePtr new_leaf, std::string split_id) {
  PanePtr target = find_pane(root, target_id);
  if (!target || target->is_split() || !new_leaf) return root;
  return replace_pane(root, target_id, make_split_pane(std::move(split_id), dir, target, std::move(new_leaf), 0.5f));
}

static PanePtr remove_internal(const PanePtr& node, const std::string& target, bool& removed) {
  if (!node) return node;
  const SplitContent* s = node->split();
  if (!s) {
    if (node->id != target) return node;
    removed = true;
    return nullptr;
  }
  PanePtr first = remove_internal(s->first, target, removed);
  if (removed) {
    if (!first) return s->second;
    return with_children(*node, std::move(first), s->second, s->ratio);
  }
  PanePtr second = remove_internal(s->second, target, removed);
  if (removed) {
    if (!second) return s->first;
    return with_children(*node, s->first, std::move(second), s->ratio);
  }
  return node;
}

PanePtr remove_pane(const PanePtr& root, const std::string& target_id) {
  bool removed = false;
  PanePtr out = remove_internal(root, target_id, removed);
  return removed ? out : root;
}

PanePtr update_ratio(const PanePtr& root, const std::string& split_id, float ratio) {
  if (!root) return root;
  const SplitContent* s = root->split();
  if (!s) return root;
  if (root->id == split_id) return with_children(*root, s->first, s->second, clamp_ratio(ratio));
  PanePtr first = update_ratio(s->first, split_id, ratio);
  if (first != s->first) return with_children(*root, std::move(first), s->second, s->ratio);
  PanePtr second = update_ratio(s->second, split_id, ratio);
  if (second != s->second) return with_children(*root, s->first, std::move(second), s->ratio);
  return root;
}

template <class Pred>
static void leaves_into(const PanePtr& node, std::vector<PanePtr>& out, Pred keep) {
  if (!node) return;
  if (const SplitContent* s = node->split()) {
    leaves_into(s->first, out, keep);
    leaves_into(s->second, out, keep);
    return;
  }
  if (keep(*node)) out.push_back(node);
}

std::vector<PanePtr> enumerate_leaves(const PanePtr& root) {
  std::vector<PanePtr> out;
  leaves_into(root, out, [](const PaneNode&) { return true; });
  return out;
}

std::vector<PanePtr> enumerate_content_panes(const PanePtr& root) {
  std::vector<PanePtr> out;
  leaves_into(root, out, [](const PaneNode& n) { return n.is_leaf(); });
  return out;
}

std::vector<PanePtr> enumerate_terminals(const PanePtr& root) {
  std::vector<PanePtr> out;
  leaves_into(root, out, [](const PaneNode& n) { return n.terminal() != nullptr; });
  return out;
}

int count_leaves(const PanePtr& root) {
  if (!root) return 0;
  if (const SplitContent* s = root->split()) return count_leaves(s->first) + count_leaves(s->second);
  return 1;
}

static bool check_node(const PanePtr& node, std::unordered_set<std::string>& ids, std::string& msg) {
  if (!node) { msg = "missing child node"; return false; }
  if (node->id.empty()) { msg = "node without id"; return false; }
  if (!ids.insert(node->id).second) { msg = "duplicate id: " + node->id; return false; }
  const SplitContent* s = node->split();
  if (!s) return true;
  if (!s->first || !s->second) { msg = "split with a missing child: " + node->id; return false; }
  if (!(s->ratio >= kMinSplitRatio && s->ratio <= kMaxSplitRatio)) { msg = "split ratio out of range: " + node->id; return false; }
  return check_node(s->first, ids, msg) && check_node(s->second, ids, msg);
}

bool check_tree(const PanePtr& root, std::string& msg) {
  std::unordered_set<std::string> ids;
  return check_node(root, ids, msg);
}
