#pragma once
/*
 * TabManager
 *
 * Purpose: owns every tab and its pane tree; the only component that mutates trees.
 * Active tab and active pane are plain ids next to the trees, so activating a
 * pane never rebuilds a tree.
 * Rules:
 *   - there is always at least one tab (closing the last one opens a fresh terminal tab)
 *   - closing the only pane of a tab is refused; closing the tab is a separate action
 *   - every content leaf that leaves a tree is handed to IPaneResources::release
 *     before the new tree is published
 *   - pinned tabs come first; `order` is dense and zero-based
 *   - web surface addresses are validated before a pane is built; the error is
 *     returned to the caller
 */
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "id_generator.hpp"
#include "pane_node.hpp"
#include "signal.hpp"
#include "types.hpp"

struct Tab {
  std::string id;
  std::string title;
  PanePtr root;
  int order = 0;
  bool pinned = false;
  std::optional<PinIcon> pin_icon;
  std::optional<TabColor> pin_color;
  std::optional<TabColor> pin_background_color;
  std::optional<TabColor> tab_color;
  std::optional<TabColor> tab_background_color;
  std::optional<std::string> resource_path;
};

// Backing resources of content leaves (terminal processes, native surfaces).
class IPaneResources {
public:
  virtual ~IPaneResources() = default;
  virtual void release(const PaneNode& leaf) = 0;
};

// getCurrentWorkingDirectory for new terminal tabs.
using CwdProvider = std::function<bool(std::string& cwd, std::string& msg)>;
CwdProvider process_cwd_provider();

class TabManager {
public:
  TabManager(IPaneResources* resources, CwdProvider cwd);

  // Tabs
  std::string create_tab(const std::optional<std::string>& title = std::nullopt,
                         const std::optional<std::string>& cwd = std::nullopt);
  std::optional<std::string> create_tab_with_content(const PaneSpec& spec, std::string& msg);
  std::optional<std::string> create_web_tab(const std::string& url, const std::optional<std::string>& title, std::string& msg);
  std::string create_widget_tab(const std::string& widget_type, const std::optional<std::string>& title = std::nullopt,
                                nlohmann::json config = nullptr);
  std::string create_editor_tab(const std::string& file_path, const std::optional<std::string>& title = std::nullopt,
                                bool read_only = false);
  void close_tab(const std::string& tab_id);
  bool set_active_tab(const std::string& tab_id);
  bool set_active_tab_index(int index);
  void next_tab(int step);
  bool reorder_tab(int from, int to);
  bool rename_tab(const std::string& tab_id, const std::string& title);
  bool pin_tab(const std::string& tab_id);
  bool unpin_tab(const std::string& tab_id);
  bool toggle_pin_tab(const std::string& tab_id);
  bool update_pinned_tab_style(const std::string& tab_id, std::optional<PinIcon> icon, std::optional<TabColor> color,
                               std::optional<TabColor> background);
  bool update_tab_style(const std::string& tab_id, std::optional<TabColor> color, std::optional<TabColor> background);

  // Panes (active tab)
  bool split_active_pane(SplitDirection dir, const std::optional<PaneSpec>& content, std::string& msg);
  bool split_active_pane_with_surface(SplitDirection dir, const std::string& url, const std::optional<std::string>& title,
                                      std::string& msg);
  bool close_active_pane();
  bool close_pane(const std::string& pane_id);
  bool resize_split(const std::string& split_id, float ratio);
  bool set_active_pane(const std::string& pane_id);
  void focus_next_pane(int step);
  bool replace_pane(const std::string& pane_id, const PaneSpec& content, std::string& msg);
  bool navigate_pane(const std::string& pane_id, const std::string& input, std::string& msg);
  bool update_terminal_view_mode(const std::string& pane_id, TerminalViewMode mode);

  // Replaces all tabs (session restore). Current leaves are released.
  void restore(std::vector<Tab> tabs, int active_index);

  const std::vector<Tab>& tabs() const { return tabs_; }
  const Tab* active_tab() const;
  const Tab* find_tab(const std::string& tab_id) const;
  int active_tab_index() const;
  const std::string& active_tab_id() const { return active_tab_id_; }
  const std::string& active_pane_id() const { return active_pane_id_; }
  PanePtr active_pane() const;
  IdGenerator& pane_ids() { return pane_ids_; }
  IdGenerator& tab_ids() { return tab_ids_; }

  // Tree or active tab changed (persistence).
  Signal<> changed;
  // Directory that should be treated as current (file explorer).
  Signal<const std::string&> cwd_changed;
  Signal<const std::string&, const std::string&> surface_navigated;

private:
  Tab* mutable_tab(const std::string& tab_id);
  Tab* tab_of_pane(const std::string& pane_id);
  Tab* mutable_active_tab();
  bool validate_spec(const PaneSpec& spec, std::string& msg) const;
  PanePtr build_leaf(const PaneSpec& spec);
  std::string open_tab(PaneSpec spec);
  std::string default_title(const PaneSpec& spec, const PanePtr& root) const;
  std::string add_tab(Tab tab);
  void release_tree(const PanePtr& root);
  void resequence();
  void activate_first_pane(const Tab& tab);
  void revalidate_active_pane();
  void announce_cwd(const PaneNode& leaf);
  Tab make_default_tab(const std::string& title, const std::optional<std::string>& cwd);

  IPaneResources* resources_;
  CwdProvider cwd_;
  IdGenerator tab_ids_{"tab"};
  IdGenerator pane_ids_{"pane"};
  std::vector<Tab> tabs_;
  std::string active_tab_id_;
  std::string active_pane_id_;
};
