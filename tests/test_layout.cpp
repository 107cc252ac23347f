#include "id_generator.hpp"
#include "pane_layout.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static int width_for_pane(const std::vector<PaneRect>& rs, const std::string& pane) {
  for (const auto& r : rs) if (r.pane == pane) return r.rect.width;
  return -1;
}

static int height_for_pane(const std::vector<PaneRect>& rs, const std::string& pane) {
  for (const auto& r : rs) if (r.pane == pane) return r.rect.height;
  return -1;
}

static void test_geometry() {
  PanePtr root = make_terminal_pane("a", "Terminal 1");
  Rect screen{0, 0, 24, 80};
  std::vector<PaneRect> rs;
  collect_layout(*root, screen, rs);
  assert(rs.size() == 1);
  assert(rs[0].rect == screen);

  root = split_pane(root, "a", SplitDirection::Vertical, make_terminal_pane("b", "Terminal 2"), "s1");
  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs.size() == 2);
  assert(rs[0].pane == "a");
  assert(width_for_pane(rs, "a") + width_for_pane(rs, "b") == 80);
  assert(height_for_pane(rs, "b") == 24);

  root = split_pane(root, "b", SplitDirection::Horizontal, make_web_pane("c", "Web", "https://example.com"), "s2");
  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs.size() == 3);
  assert(height_for_pane(rs, "b") + height_for_pane(rs, "c") == 24);
  assert(width_for_pane(rs, "c") == width_for_pane(rs, "b"));

  // too small to show anything: leaves are still reported
  rs.clear();
  collect_layout(*root, Rect{0, 0, 0, 0}, rs);
  assert(rs.size() == 3);
  for (const auto& r : rs) assert(r.rect.empty());
}

static void test_structural_sharing() {
  PanePtr a = make_terminal_pane("a", "Terminal 1");
  PanePtr b = make_terminal_pane("b", "Terminal 2");
  PanePtr c = make_editor_pane("c", "notes", "/tmp/notes.txt");
  PanePtr inner = make_split_pane("s2", SplitDirection::Horizontal, b, c);
  PanePtr root = make_split_pane("s1", SplitDirection::Vertical, a, inner);

  PanePtr replaced = replace_pane(root, "c", make_widget_pane("c", "Clock", "clock"));
  assert(replaced != root);
  assert(replaced->split()->first == a); // untouched subtree shared
  assert(find_pane(replaced, "c")->widget() != nullptr);
  assert(find_pane(root, "c")->editor() != nullptr); // input unchanged

  assert(replace_pane(root, "missing", b) == root);
  assert(split_pane(root, "missing", SplitDirection::Vertical, b, "s9") == root);
  assert(remove_pane(root, "missing") == root);
}

static void test_remove_and_collapse() {
  PanePtr root = make_split_pane("s1", SplitDirection::Vertical, make_terminal_pane("a", "T"),
                                 make_split_pane("s2", SplitDirection::Horizontal, make_terminal_pane("b", "T"),
                                                 make_terminal_pane("c", "T")));
  assert(count_leaves(root) == 3);
  assert(find_parent_split(root, "b")->id == "s2");
  assert(find_parent_split(root, "s1") == nullptr);

  PanePtr r1 = remove_pane(root, "c");
  assert(count_leaves(r1) == 2);
  assert(find_pane(r1, "s2") == nullptr); // parent collapsed into sibling
  assert(r1->split()->second->id == "b");

  PanePtr r2 = remove_pane(r1, "a");
  assert(r2->is_leaf());
  assert(r2->id == "b");
  assert(remove_pane(r2, "b") == nullptr);
}

static void test_ratio_and_enumeration() {
  PanePtr root = make_split_pane("s1", SplitDirection::Vertical, make_terminal_pane("a", "T"),
                                 make_web_pane("w", "Web", "https://example.com"));
  PanePtr wide = update_ratio(root, "s1", 0.95f);
  assert(wide->split()->ratio == kMaxSplitRatio);
  PanePtr narrow = update_ratio(root, "s1", 0.0f);
  assert(narrow->split()->ratio == kMinSplitRatio);
  assert(narrow->split()->first == root->split()->first);

  auto leaves = enumerate_leaves(root);
  assert(leaves.size() == 2);
  assert(leaves[0]->id == "a" && leaves[1]->id == "w");
  auto content = enumerate_content_panes(root);
  assert(content.size() == 2 && content[0] == leaves[0]);
  auto terms = enumerate_terminals(root);
  assert(terms.size() == 1);
  assert(terms[0]->id == "a");

  std::string msg;
  assert(check_tree(root, msg));
  PanePtr dup = make_split_pane("s1", SplitDirection::Vertical, make_terminal_pane("a", "T"), make_terminal_pane("a", "T"));
  assert(!check_tree(dup, msg));
  assert(!msg.empty());
}

// Random split/remove/resize sequences from a single leaf keep the tree valid.
static void test_random_operation_sequences() {
  std::mt19937 rng(20241019);
  std::uniform_real_distribution<float> any_ratio(-1.0f, 2.0f);
  IdGenerator ids("p");
  for (int round = 0; round < 200; ++round) {
    PanePtr root = make_terminal_pane(ids.next(), "T");
    for (int step = 0; step < 40; ++step) {
      auto leaves = enumerate_leaves(root);
      int n = static_cast<int>(leaves.size());
      std::string target = leaves[rng() % leaves.size()]->id;
      std::string msg;
      switch (rng() % 4) {
        case 0: {
          SplitDirection dir = rng() % 2 ? SplitDirection::Vertical : SplitDirection::Horizontal;
          PanePtr next = split_pane(root, target, dir, make_web_pane(ids.next(), "W", "https://example.com"), ids.next());
          assert(count_leaves(next) == n + 1);
          assert(find_parent_split(next, target)->split()->ratio == 0.5f);
          root = next;
          break;
        }
        case 1: {
          PanePtr next = remove_pane(root, target);
          if (n == 1) {
            assert(next == nullptr);
            continue;
          }
          assert(count_leaves(next) == n - 1);
          assert(!find_pane(next, target));
          root = next;
          break;
        }
        case 2: {
          PanePtr parent = find_parent_split(root, target);
          if (!parent) continue;
          root = update_ratio(root, parent->id, any_ratio(rng));
          float r = find_pane(root, parent->id)->split()->ratio;
          assert(r >= kMinSplitRatio && r <= kMaxSplitRatio);
          break;
        }
        default:
          // ids that are gone leave the tree untouched
          assert(split_pane(root, "gone", SplitDirection::Vertical, make_terminal_pane(ids.next(), "T"), ids.next()) == root);
          assert(remove_pane(root, "gone") == root);
          break;
      }
      assert(check_tree(root, msg));
    }
  }
}

int main() {
  test_geometry();
  test_structural_sharing();
  test_remove_and_collapse();
  test_ratio_and_enumeration();
  test_random_operation_sequences();
  return 0;
}
