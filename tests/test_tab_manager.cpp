#include "pane_layout.hpp"
#include "tab_manager.hpp"
#include <cassert>
#include <string>
#include <vector>

// Records released leaves and whether each was still published when released.
struct RecordingResources : IPaneResources {
  TabManager* tabs = nullptr;
  std::vector<std::string> released;
  bool released_after_removal = false;

  void release(const PaneNode& leaf) override {
    released.push_back(leaf.id);
    if (!tabs) return;
    bool present = false;
    for (const auto& t : tabs->tabs()) if (find_pane(t.root, leaf.id)) present = true;
    if (!present) released_after_removal = true;
  }
};

static CwdProvider fixed_cwd(const std::string& dir) {
  return [dir](std::string& cwd, std::string&) { cwd = dir; return true; };
}

static void test_default_tab() {
  RecordingResources res;
  TabManager tm(&res, fixed_cwd("/home/user"));
  assert(tm.tabs().size() == 1);
  const Tab* t = tm.active_tab();
  assert(t->title == "Terminal 1");
  assert(t->root->terminal());
  assert(*t->root->terminal()->cwd == "/home/user");
  assert(tm.active_pane_id() == t->root->id);

  std::string second = tm.create_tab();
  assert(tm.active_tab_id() == second);
  assert(tm.active_tab()->title == "Terminal 2");
  assert(tm.active_tab()->order == 1);
}

static void test_close_tabs() {
  RecordingResources res;
  TabManager tm(&res, fixed_cwd("/tmp"));
  res.tabs = &tm;
  std::string first = tm.active_tab_id();
  std::string second = tm.create_tab();
  std::string third = tm.create_tab();
  tm.set_active_tab(second);
  std::string second_pane = tm.active_pane_id();
  tm.close_tab(second);
  assert(tm.tabs().size() == 2);
  assert(tm.active_tab_id() == third); // same index
  assert(res.released == std::vector<std::string>{second_pane});
  assert(tm.tabs()[1].order == 1);

  tm.close_tab(third);
  assert(tm.active_tab_id() == first);
  tm.close_tab(first);
  // closing the last tab leaves a fresh terminal tab
  assert(tm.tabs().size() == 1);
  assert(tm.active_tab()->title == "Terminal 1");
  assert(tm.active_tab_id() != first);
  assert(res.released.size() == 3);
  assert(!res.released_after_removal);
}

static void test_pinning() {
  TabManager tm(nullptr, fixed_cwd("/tmp"));
  std::string a = tm.active_tab_id();
  std::string b = tm.create_tab();
  std::string c = tm.create_tab();
  assert(tm.pin_tab(c));
  assert(!tm.pin_tab(c));
  assert(tm.tabs()[0].id == c);
  assert(tm.tabs()[0].pinned);
  assert(tm.pin_tab(b));
  assert(tm.tabs()[0].id == c && tm.tabs()[1].id == b && tm.tabs()[2].id == a);
  for (size_t i = 0; i < tm.tabs().size(); ++i) assert(tm.tabs()[i].order == static_cast<int>(i));

  // an unpinned tab cannot move in front of pinned ones
  assert(tm.reorder_tab(2, 0));
  assert(tm.tabs()[2].id == a);

  assert(tm.unpin_tab(c));
  assert(tm.tabs()[0].id == b);
  assert(tm.tabs()[1].id == c);
  assert(tm.toggle_pin_tab(c));
  assert(tm.find_tab(c)->pinned);

  assert(tm.update_pinned_tab_style(c, PinIcon::Star, TabColor::Red, std::nullopt));
  assert(tm.find_tab(c)->pin_icon == PinIcon::Star);
  assert(tm.find_tab(c)->pin_color == TabColor::Red);
  assert(!tm.update_pinned_tab_style(a, PinIcon::Star, std::nullopt, std::nullopt));
  assert(tm.update_tab_style(a, TabColor::Blue, TabColor::White));
  assert(tm.find_tab(a)->tab_color == TabColor::Blue);

  assert(tm.rename_tab(a, "logs"));
  assert(!tm.rename_tab(a, ""));
  assert(tm.find_tab(a)->title == "logs");
  assert(!tm.reorder_tab(0, 5));
}

static void test_split_and_close_panes() {
  RecordingResources res;
  TabManager tm(&res, fixed_cwd("/srv"));
  res.tabs = &tm;
  std::string msg;
  std::string first = tm.active_pane_id();
  assert(tm.split_active_pane(SplitDirection::Vertical, std::nullopt, msg));
  PanePtr second = tm.active_pane();
  assert(second->id != first);
  assert(second->title == "Terminal 2");
  assert(*second->terminal()->cwd == "/srv");
  assert(tm.active_tab()->root->split()->direction == SplitDirection::Vertical);

  assert(!tm.split_active_pane_with_surface(SplitDirection::Horizontal, "http://localhost:8080", std::nullopt, msg));
  assert(msg.find("Localhost") != std::string::npos);
  assert(count_leaves(tm.active_tab()->root) == 2);

  assert(tm.split_active_pane_with_surface(SplitDirection::Horizontal, "https://example.com/docs", std::nullopt, msg));
  PanePtr web = tm.active_pane();
  assert(web->web_surface()->url == "https://example.com/docs");
  assert(web->title == "example.com");

  std::string split_id = find_parent_split(tm.active_tab()->root, web->id)->id;
  assert(tm.resize_split(split_id, 0.99f));
  assert(find_pane(tm.active_tab()->root, split_id)->split()->ratio == kMaxSplitRatio);
  assert(!tm.resize_split(web->id, 0.3f));

  tm.focus_next_pane(1);
  assert(tm.active_pane_id() == first);
  tm.focus_next_pane(-1);
  assert(tm.active_pane_id() == web->id);

  assert(tm.close_active_pane());
  assert(res.released == std::vector<std::string>{web->id});
  assert(count_leaves(tm.active_tab()->root) == 2);
  assert(tm.active_pane() && tm.active_pane()->is_leaf());
  assert(tm.close_pane(first));
  // the only pane of a tab stays
  assert(!tm.close_active_pane());
  assert(tm.tabs().size() == 1);
  assert(!res.released_after_removal);
}

static void test_navigate_and_replace() {
  RecordingResources res;
  TabManager tm(&res, fixed_cwd("/tmp"));
  std::string msg;
  std::vector<std::pair<std::string, std::string>> navigations;
  tm.surface_navigated.connect([&](const std::string& pane, const std::string& url) { navigations.emplace_back(pane, url); });

  auto tab = tm.create_web_tab("https://example.com", std::nullopt, msg);
  assert(tab);
  assert(tm.active_tab()->title == "example.com");
  std::string pane = tm.active_pane_id();

  assert(tm.navigate_pane(pane, "example.org", msg));
  assert(tm.active_pane()->web_surface()->url == "https://example.org");
  assert(navigations.size() == 1 && navigations[0].second == "https://example.org");
  assert(tm.active_pane_id() == pane); // same leaf identity

  assert(!tm.navigate_pane(pane, "http://192.168.0.1", msg));
  assert(tm.active_pane()->web_surface()->url == "https://example.org");
  assert(!tm.create_web_tab("ftp://example.com", std::nullopt, msg));

  assert(tm.replace_pane(pane, PaneSpec{"", WidgetContent{"clock", nullptr}}, msg));
  assert(res.released == std::vector<std::string>{pane});
  assert(tm.active_pane()->widget());
  assert(tm.active_pane()->title == "Clock");
  assert(tm.active_pane_id() != pane);
  assert(!tm.replace_pane(tm.active_pane_id(), PaneSpec{"", WidgetContent{"", nullptr}}, msg));
}

static void test_cwd_signal_and_view_mode() {
  TabManager tm(nullptr, fixed_cwd("/work"));
  std::vector<std::string> dirs;
  tm.cwd_changed.connect([&](const std::string& d) { dirs.push_back(d); });
  std::string editor_tab = tm.create_editor_tab("/work/src/main.cpp", std::nullopt, true);
  assert(tm.active_tab()->title == "main.cpp");
  assert(tm.active_tab()->resource_path == std::string("/work/src/main.cpp"));
  assert(tm.active_pane()->editor()->read_only);
  assert(dirs.back() == "/work/src");

  tm.set_active_tab_index(0);
  assert(dirs.back() == "/work");
  std::string term = tm.active_pane_id();
  assert(tm.update_terminal_view_mode(term, TerminalViewMode::Blocks));
  assert(tm.active_pane()->terminal()->view_mode == TerminalViewMode::Blocks);
  assert(!tm.update_terminal_view_mode(tm.find_tab(editor_tab)->root->id, TerminalViewMode::Blocks));

  tm.next_tab(1);
  assert(tm.active_tab_id() == editor_tab);
  tm.next_tab(1);
  assert(tm.active_tab_index() == 0);

  std::string widget_tab = tm.create_widget_tab("notes", std::nullopt, nlohmann::json{{"text", "hi"}});
  assert(tm.find_tab(widget_tab)->title == "Notes");
  assert(tm.active_pane()->widget()->config["text"] == "hi");
}

static void test_create_tab_with_content() {
  TabManager tm(nullptr, fixed_cwd("/srv"));
  std::string msg;
  assert(!tm.create_tab_with_content(PaneSpec{"", WebSurfaceContent{"http://127.0.0.1:8080"}}, msg));
  assert(msg.find("Blocked URL host") != std::string::npos);
  assert(!tm.create_tab_with_content(PaneSpec{"", WebSurfaceContent{"http://127.1:8080"}}, msg));
  assert(tm.tabs().size() == 1);

  auto web = tm.create_tab_with_content(PaneSpec{"", WebSurfaceContent{"https://example.com"}}, msg);
  assert(web);
  assert(tm.active_tab_id() == *web);
  assert(tm.active_tab()->title == "example.com");
  assert(tm.active_pane()->title == "example.com");
  assert(tm.active_pane()->web_surface()->url == "https://example.com");

  auto term = tm.create_tab_with_content(PaneSpec{"", TerminalContent{}}, msg);
  assert(term);
  assert(tm.active_tab()->title == "Terminal 3");
  assert(tm.active_pane()->title == "Terminal 3");
  assert(*tm.active_pane()->terminal()->cwd == "/srv");

  auto named = tm.create_tab_with_content(PaneSpec{"build", TerminalContent{std::string("/tmp"), TerminalViewMode::Blocks}}, msg);
  assert(named);
  assert(tm.active_tab()->title == "build");
  assert(*tm.active_pane()->terminal()->cwd == "/tmp");

  assert(!tm.create_tab_with_content(PaneSpec{"", EditorContent{"", std::nullopt, false}}, msg));
  auto editor = tm.create_tab_with_content(PaneSpec{"", EditorContent{"/srv/app.py", std::string("python"), false}}, msg);
  assert(editor);
  assert(tm.active_tab()->resource_path == std::string("/srv/app.py"));
  assert(tm.active_pane()->title == "app.py");
  assert(tm.tabs().size() == 5);

  // the web tab helper titles tab and pane alike
  auto titled = tm.create_web_tab("https://docs.example.com/x", std::nullopt, msg);
  assert(titled);
  assert(tm.active_tab()->title == "docs.example.com");
  assert(tm.active_pane()->title == "docs.example.com");
}

static void test_restore_releases_current() {
  RecordingResources res;
  TabManager tm(&res, fixed_cwd("/tmp"));
  std::string old_pane = tm.active_pane_id();
  std::vector<Tab> tabs(2);
  tabs[0].id = "tab-a";
  tabs[0].title = "second";
  tabs[0].order = 1;
  tabs[0].root = make_terminal_pane("pane-a", "Terminal 1");
  tabs[1].id = "tab-b";
  tabs[1].title = "first";
  tabs[1].order = 0;
  tabs[1].root = make_web_pane("pane-b", "Web", "https://example.com");
  tm.restore(std::move(tabs), 7);
  assert(res.released == std::vector<std::string>{old_pane});
  assert(tm.tabs()[0].id == "tab-b");
  assert(tm.active_tab_id() == "tab-a"); // index clamped to the last tab
  assert(tm.active_pane_id() == "pane-a");
}

int main() {
  test_default_tab();
  test_close_tabs();
  test_pinning();
  test_split_and_close_panes();
  test_navigate_and_replace();
  test_cwd_signal_and_view_mode();
  test_create_tab_with_content();
  test_restore_releases_current();
  return 0;
}
