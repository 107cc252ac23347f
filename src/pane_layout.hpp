#pragma once
/*
 * PaneLayout
 *
 * Purpose: pure structural algorithms over an immutable pane tree, plus the
 * geometry pass that turns a tree into one rectangle per leaf.
 * Contract: every function returns a new root (or the same root when nothing
 * applies) and never mutates its input. Nodes off the changed path are shared.
 */
#include <string>
#include <vector>
#include "pane_node.hpp"
#include "types.hpp"

struct PaneRect {
  std::string pane;
  Rect rect;
};

// Leaf-order (left-to-right, depth-first) rectangles. Leaves squeezed out of
// a too-small area are still reported, with an empty rect.
void collect_layout(const PaneNode& node, const Rect& area, std::vector<PaneRect>& out);

PanePtr find_pane(const PanePtr& root, const std::string& id);
// Split node whose direct child has `id`; nullptr for the root or unknown ids.
PanePtr find_parent_split(const PanePtr& root, const std::string& id);

// Substitutes the node with `target_id`. Returns `root` itself when absent.
PanePtr replace_pane(const PanePtr& root, const std::string& target_id, PanePtr replacement);

// Wraps leaf `target_id` in a new split (ratio 0.5, existing leaf first).
// Returns `root` itself when the leaf vanished; that is a race, not an error.
PanePtr split_pane(const PanePtr& root, const std::string& target_id, SplitDirection dir,
                   PanePtr new_leaf, std::string split_id);

// Removes leaf `target_id` and collapses its parent split into the sibling.
// nullptr when the tree would become empty; `root` itself when absent.
PanePtr remove_pane(const PanePtr& root, const std::string& target_id);

// Clamps to [0.1, 0.9] and rewrites only the path to `split_id`.
PanePtr update_ratio(const PanePtr& root, const std::string& split_id, float ratio);

// Left to right, depth first; leaves.front() is the "first pane".
std::vector<PanePtr> enumerate_leaves(const PanePtr& root);
// Same walk over content nodes only; picks the pane activated on a tab switch.
std::vector<PanePtr> enumerate_content_panes(const PanePtr& root);
std::vector<PanePtr> enumerate_terminals(const PanePtr& root);
int count_leaves(const PanePtr& root);

// Binary shape, unique ids, ratios in range.
bool check_tree(const PanePtr& root, std::string& msg);
