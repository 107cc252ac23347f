#include "tab_manager.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include "log.hpp"
#include "pane_layout.hpp"
#include "url_validator.hpp"

CwdProvider process_cwd_provider() {
  return [](std::string& cwd, std::string& msg) {
    std::error_code ec;
    auto p = std::filesystem::current_path(ec);
    if (ec) { msg = ec.message(); return false; }
    cwd = p.string();
    return true;
  };
}

static std::string capitalize(std::string s) {
  if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  return s;
}

static std::string file_name_of(const std::string& path) {
  std::string name = std::filesystem::path(path).filename().string();
  return name.empty() ? path : name;
}

TabManager::TabManager(IPaneResources* resources, CwdProvider cwd)
    : resources_(resources), cwd_(std::move(cwd)) {
  Tab tab = make_default_tab("Terminal 1", std::nullopt);
  active_tab_id_ = tab.id;
  active_pane_id_ = tab.root->id;
  tabs_.push_back(std::move(tab));
}

Tab TabManager::make_default_tab(const std::string& title, const std::optional<std::string>& cwd) {
  Tab tab;
  tab.id = tab_ids_.next();
  tab.title = title;
  std::optional<std::string> dir = cwd;
  if (!dir && cwd_) {
    std::string got, err;
    if (cwd_(got, err)) dir = got;
    else log_warn("tabs", "cannot determine working directory: " + err);
  }
  tab.root = make_terminal_pane(pane_ids_.next(), title, dir);
  return tab;
}

// ---- lookup ----

const Tab* TabManager::find_tab(const std::string& tab_id) const {
  for (const auto& t : tabs_) if (t.id == tab_id) return &t;
  return nullptr;
}

Tab* TabManager::mutable_tab(const std::string& tab_id) {
  for (auto& t : tabs_) if (t.id == tab_id) return &t;
  return nullptr;
}

Tab* TabManager::tab_of_pane(const std::string& pane_id) {
  for (auto& t : tabs_) if (find_pane(t.root, pane_id)) return &t;
  return nullptr;
}

const Tab* TabManager::active_tab() const { return find_tab(active_tab_id_); }
Tab* TabManager::mutable_active_tab() { return mutable_tab(active_tab_id_); }

int TabManager::active_tab_index() const {
  for (size_t i = 0; i < tabs_.size(); ++i)
    if (tabs_[i].id == active_tab_id_) return static_cast<int>(i);
  return 0;
}

PanePtr TabManager::active_pane() const {
  const Tab* t = active_tab();
  return t ? find_pane(t->root, active_pane_id_) : nullptr;
}

// ---- helpers ----

bool TabManager::validate_spec(const PaneSpec& spec, std::string& msg) const {
  if (const auto* web = std::get_if<WebSurfaceContent>(&spec.content)) {
    return validate_surface_url(web->url, msg);
  }
  if (const auto* w = std::get_if<WidgetContent>(&spec.content)) {
    if (w->widget_type.empty()) { msg = "widget type required"; return false; }
  }
  if (const auto* e = std::get_if<EditorContent>(&spec.content)) {
    if (e->file_path.empty()) { msg = "file path required"; return false; }
  }
  return true;
}

std::string TabManager::default_title(const PaneSpec& spec, const PanePtr& root) const {
  if (!spec.title.empty()) return spec.title;
  switch (kind_of(spec.content)) {
    case PaneNode::Kind::Terminal:
      return "Terminal " + std::to_string(enumerate_terminals(root).size() + 1);
    case PaneNode::Kind::WebSurface: {
      std::string host = url_host(std::get<WebSurfaceContent>(spec.content).url);
      return host.empty() ? "Web" : host;
    }
    case PaneNode::Kind::Widget:
      return capitalize(std::get<WidgetContent>(spec.content).widget_type);
    case PaneNode::Kind::Editor:
      return file_name_of(std::get<EditorContent>(spec.content).file_path);
    default:
      return "Pane";
  }
}

PanePtr TabManager::build_leaf(const PaneSpec& spec) { return make_leaf(pane_ids_.next(), spec); }

std::string TabManager::add_tab(Tab tab) {
  std::string id = tab.id;
  tab.order = static_cast<int>(tabs_.size());
  tabs_.push_back(std::move(tab));
  const Tab& added = tabs_.back();
  active_tab_id_ = id;
  activate_first_pane(added);
  changed.emit();
  return id;
}

void TabManager::release_tree(const PanePtr& root) {
  if (!resources_) return;
  for (const auto& leaf : enumerate_leaves(root)) resources_->release(*leaf);
}

void TabManager::resequence() {
  std::stable_partition(tabs_.begin(), tabs_.end(), [](const Tab& t) { return t.pinned; });
  for (size_t i = 0; i < tabs_.size(); ++i) tabs_[i].order = static_cast<int>(i);
}

void TabManager::announce_cwd(const PaneNode& leaf) {
  if (const TerminalContent* t = leaf.terminal()) {
    if (t->cwd && !t->cwd->empty()) cwd_changed.emit(*t->cwd);
  } else if (const EditorContent* e = leaf.editor()) {
    std::string dir = std::filesystem::path(e->file_path).parent_path().string();
    if (!dir.empty()) cwd_changed.emit(dir);
  }
}

void TabManager::activate_first_pane(const Tab& tab) {
  auto panes = enumerate_content_panes(tab.root);
  if (panes.empty()) { active_pane_id_.clear(); return; }
  active_pane_id_ = panes.front()->id;
  announce_cwd(*panes.front());
}

void TabManager::revalidate_active_pane() {
  if (!active_tab() && !tabs_.empty()) active_tab_id_ = tabs_.front().id;
  const Tab* tab = active_tab();
  if (!tab) { active_pane_id_.clear(); return; }
  PanePtr p = find_pane(tab->root, active_pane_id_);
  if (p && p->is_leaf()) return;
  auto leaves = enumerate_leaves(tab->root);
  active_pane_id_ = leaves.empty() ? std::string() : leaves.front()->id;
}

// ---- tabs ----

std::string TabManager::create_tab(const std::optional<std::string>& title, const std::optional<std::string>& cwd) {
  return open_tab(PaneSpec{title.value_or(""), TerminalContent{cwd, TerminalViewMode::Classic}});
}

std::optional<std::string> TabManager::create_tab_with_content(const PaneSpec& spec, std::string& msg) {
  if (!validate_spec(spec, msg)) return std::nullopt;
  return open_tab(spec);
}

std::optional<std::string> TabManager::create_web_tab(const std::string& url, const std::optional<std::string>& title,
                                                      std::string& msg) {
  return create_tab_with_content(PaneSpec{title.value_or(""), WebSurfaceContent{url}}, msg);
}

std::string TabManager::create_widget_tab(const std::string& widget_type, const std::optional<std::string>& title,
                                          nlohmann::json config) {
  return open_tab(PaneSpec{title.value_or(""), WidgetContent{widget_type, std::move(config)}});
}

std::string TabManager::create_editor_tab(const std::string& file_path, const std::optional<std::string>& title,
                                          bool read_only) {
  return open_tab(PaneSpec{title.value_or(""), EditorContent{file_path, std::nullopt, read_only}});
}

// Tab and its single leaf share one title.
std::string TabManager::open_tab(PaneSpec spec) {
  if (auto* t = std::get_if<TerminalContent>(&spec.content); t && !t->cwd && cwd_) {
    std::string got, err;
    if (cwd_(got, err)) t->cwd = got;
    else log_warn("tabs", "cannot determine working directory: " + err);
  }
  if (spec.title.empty()) {
    spec.title = std::holds_alternative<TerminalContent>(spec.content) ? "Terminal " + std::to_string(tabs_.size() + 1)
                                                                         : default_title(spec, nullptr);
  }
  Tab tab;
  tab.id = tab_ids_.next();
  tab.title = spec.title;
  if (const auto* e = std::get_if<EditorContent>(&spec.content)) tab.resource_path = e->file_path;
  tab.root = build_leaf(spec);
  log_info("tabs", "new tab " + tab.id + " (" + tab.title + ")");
  return add_tab(std::move(tab));
}

void TabManager::close_tab(const std::string& tab_id) {
  auto it = std::find_if(tabs_.begin(), tabs_.end(), [&](const Tab& t) { return t.id == tab_id; });
  if (it == tabs_.end()) return;
  size_t index = static_cast<size_t>(it - tabs_.begin());
  bool was_active = tab_id == active_tab_id_;
  PanePtr root = it->root;
  release_tree(root);
  tabs_.erase(it);
  log_info("tabs", "closed tab " + tab_id);

  if (tabs_.empty()) {
    Tab fresh = make_default_tab("Terminal 1", std::nullopt);
    active_tab_id_ = fresh.id;
    tabs_.push_back(std::move(fresh));
    resequence();
    activate_first_pane(tabs_.front());
    changed.emit();
    return;
  }
  resequence();
  if (was_active) {
    const Tab& next = tabs_[std::min(index, tabs_.size() - 1)];
    active_tab_id_ = next.id;
    activate_first_pane(next);
  }
  changed.emit();
}

bool TabManager::set_active_tab(const std::string& tab_id) {
  const Tab* tab = find_tab(tab_id);
  if (!tab) return false;
  active_tab_id_ = tab_id;
  activate_first_pane(*tab);
  changed.emit();
  return true;
}

bool TabManager::set_active_tab_index(int index) {
  if (index < 0 || index >= static_cast<int>(tabs_.size())) return false;
  return set_active_tab(tabs_[static_cast<size_t>(index)].id);
}

void TabManager::next_tab(int step) {
  int n = static_cast<int>(tabs_.size());
  if (n <= 1) return;
  int i = ((active_tab_index() + step) % n + n) % n;
  set_active_tab_index(i);
}

bool TabManager::reorder_tab(int from, int to) {
  int n = static_cast<int>(tabs_.size());
  if (from < 0 || from >= n || to < 0 || to >= n) return false;
  if (from == to) return true;
  Tab moved = std::move(tabs_[static_cast<size_t>(from)]);
  tabs_.erase(tabs_.begin() + from);
  tabs_.insert(tabs_.begin() + to, std::move(moved));
  resequence();
  changed.emit();
  return true;
}

bool TabManager::rename_tab(const std::string& tab_id, const std::string& title) {
  Tab* tab = mutable_tab(tab_id);
  if (!tab || title.empty()) return false;
  tab->title = title;
  changed.emit();
  return true;
}

bool TabManager::pin_tab(const std::string& tab_id) {
  auto it = std::find_if(tabs_.begin(), tabs_.end(), [&](const Tab& t) { return t.id == tab_id; });
  if (it == tabs_.end() || it->pinned) return false;
  Tab tab = std::move(*it);
  tabs_.erase(it);
  tab.pinned = true;
  auto pos = std::find_if(tabs_.begin(), tabs_.end(), [](const Tab& t) { return !t.pinned; });
  tabs_.insert(pos, std::move(tab));
  resequence();
  changed.emit();
  return true;
}

bool TabManager::unpin_tab(const std::string& tab_id) {
  auto it = std::find_if(tabs_.begin(), tabs_.end(), [&](const Tab& t) { return t.id == tab_id; });
  if (it == tabs_.end() || !it->pinned) return false;
  Tab tab = std::move(*it);
  tabs_.erase(it);
  tab.pinned = false;
  auto pos = std::find_if(tabs_.begin(), tabs_.end(), [](const Tab& t) { return !t.pinned; });
  tabs_.insert(pos, std::move(tab));
  resequence();
  changed.emit();
  return true;
}

bool TabManager::toggle_pin_tab(const std::string& tab_id) {
  const Tab* tab = find_tab(tab_id);
  if (!tab) return false;
  return tab->pinned ? unpin_tab(tab_id) : pin_tab(tab_id);
}

bool TabManager::update_pinned_tab_style(const std::string& tab_id, std::optional<PinIcon> icon,
                                         std::optional<TabColor> color, std::optional<TabColor> background) {
  Tab* tab = mutable_tab(tab_id);
  if (!tab || !tab->pinned) return false;
  if (icon) tab->pin_icon = icon;
  if (color) tab->pin_color = color;
  if (background) tab->pin_background_color = background;
  changed.emit();
  return true;
}

bool TabManager::update_tab_style(const std::string& tab_id, std::optional<TabColor> color,
                                  std::optional<TabColor> background) {
  Tab* tab = mutable_tab(tab_id);
  if (!tab) return false;
  if (color) tab->tab_color = color;
  if (background) tab->tab_background_color = background;
  changed.emit();
  return true;
}

// ---- panes ----

bool TabManager::split_active_pane(SplitDirection dir, const std::optional<PaneSpec>& content, std::string& msg) {
  Tab* tab = mutable_active_tab();
  if (!tab) { msg = "no active tab"; return false; }
  revalidate_active_pane();
  PanePtr target = find_pane(tab->root, active_pane_id_);
  if (!target) { msg = "no active pane"; return false; }

  PaneSpec spec;
  if (content) {
    if (!validate_spec(*content, msg)) return false;
    spec = *content;
  } else {
    TerminalContent term;
    if (const TerminalContent* src = target->terminal()) term.cwd = src->cwd;
    spec.content = term;
  }
  spec.title = default_title(spec, tab->root);

  PanePtr leaf = build_leaf(spec);
  PanePtr next = split_pane(tab->root, target->id, dir, leaf, pane_ids_.next());
  if (next == tab->root) { msg = "pane vanished"; return false; }
  tab->root = next;
  active_pane_id_ = leaf->id;
  changed.emit();
  return true;
}

bool TabManager::split_active_pane_with_surface(SplitDirection dir, const std::string& url,
                                                const std::optional<std::string>& title, std::string& msg) {
  PaneSpec spec{title ? *title : std::string(), WebSurfaceContent{url}};
  return split_active_pane(dir, spec, msg);
}

bool TabManager::close_active_pane() { return close_pane(active_pane_id_); }

bool TabManager::close_pane(const std::string& pane_id) {
  Tab* tab = tab_of_pane(pane_id);
  if (!tab) return false;
  PanePtr leaf = find_pane(tab->root, pane_id);
  if (!leaf || leaf->is_split()) return false;
  if (count_leaves(tab->root) <= 1) return false;
  if (resources_) resources_->release(*leaf);
  tab->root = remove_pane(tab->root, pane_id);
  revalidate_active_pane();
  changed.emit();
  return true;
}

bool TabManager::resize_split(const std::string& split_id, float ratio) {
  Tab* tab = tab_of_pane(split_id);
  if (!tab) return false;
  PanePtr node = find_pane(tab->root, split_id);
  if (!node || !node->is_split()) return false;
  PanePtr next = update_ratio(tab->root, split_id, ratio);
  if (next == tab->root) return false;
  tab->root = next;
  changed.emit();
  return true;
}

bool TabManager::set_active_pane(const std::string& pane_id) {
  const Tab* tab = active_tab();
  if (!tab) return false;
  PanePtr p = find_pane(tab->root, pane_id);
  if (!p || p->is_split()) return false;
  if (active_pane_id_ == pane_id) return true;
  active_pane_id_ = pane_id;
  announce_cwd(*p);
  return true;
}

void TabManager::focus_next_pane(int step) {
  const Tab* tab = active_tab();
  if (!tab) return;
  auto leaves = enumerate_leaves(tab->root);
  if (leaves.size() <= 1) return;
  int n = static_cast<int>(leaves.size());
  int cur = 0;
  for (int i = 0; i < n; ++i)
    if (leaves[static_cast<size_t>(i)]->id == active_pane_id_) cur = i;
  set_active_pane(leaves[static_cast<size_t>(((cur + step) % n + n) % n)]->id);
}

bool TabManager::replace_pane(const std::string& pane_id, const PaneSpec& content, std::string& msg) {
  Tab* tab = tab_of_pane(pane_id);
  if (!tab) { msg = "no such pane"; return false; }
  PanePtr old = find_pane(tab->root, pane_id);
  if (!old || old->is_split()) { msg = "not a content pane"; return false; }
  if (!validate_spec(content, msg)) return false;
  PaneSpec spec = content;
  spec.title = default_title(content, tab->root);
  PanePtr leaf = build_leaf(spec);
  if (resources_) resources_->release(*old);
  tab->root = ::replace_pane(tab->root, pane_id, leaf);
  if (active_pane_id_ == pane_id) active_pane_id_ = leaf->id;
  changed.emit();
  return true;
}

bool TabManager::navigate_pane(const std::string& pane_id, const std::string& input, std::string& msg) {
  Tab* tab = tab_of_pane(pane_id);
  if (!tab) { msg = "no such pane"; return false; }
  PanePtr leaf = find_pane(tab->root, pane_id);
  if (!leaf || !leaf->web_surface()) { msg = "not a web pane"; return false; }
  std::string url = normalize_address_input(input);
  if (!validate_surface_url(url, msg)) return false;
  if (leaf->web_surface()->url == url) return true;
  tab->root = ::replace_pane(tab->root, pane_id, with_content(*leaf, WebSurfaceContent{url}));
  surface_navigated.emit(pane_id, url);
  changed.emit();
  return true;
}

bool TabManager::update_terminal_view_mode(const std::string& pane_id, TerminalViewMode mode) {
  Tab* tab = tab_of_pane(pane_id);
  if (!tab) return false;
  PanePtr leaf = find_pane(tab->root, pane_id);
  if (!leaf || !leaf->terminal()) return false;
  if (leaf->terminal()->view_mode == mode) return true;
  TerminalContent term = *leaf->terminal();
  term.view_mode = mode;
  tab->root = ::replace_pane(tab->root, pane_id, with_content(*leaf, term));
  changed.emit();
  return true;
}

void TabManager::restore(std::vector<Tab> tabs, int active_index) {
  for (const auto& t : tabs_) release_tree(t.root);
  tabs_ = std::move(tabs);
  if (tabs_.empty()) tabs_.push_back(make_default_tab("Terminal 1", std::nullopt));
  std::stable_sort(tabs_.begin(), tabs_.end(), [](const Tab& a, const Tab& b) { return a.order < b.order; });
  resequence();
  int idx = std::clamp(active_index, 0, static_cast<int>(tabs_.size()) - 1);
  active_tab_id_ = tabs_[static_cast<size_t>(idx)].id;
  activate_first_pane(tabs_[static_cast<size_t>(idx)]);
  log_info("tabs", "restored " + std::to_string(tabs_.size()) + " tabs");
  changed.emit();
}
