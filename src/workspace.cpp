#include "workspace.hpp"
#include <ncurses.h>
#include <algorithm>
#include <charconv>
#include <limits>
#include <set>
#include <sstream>
#include "file_io.hpp"
#include "log.hpp"
#include "url_validator.hpp"

static constexpr int kEsc = 27;
static constexpr float kResizeStep = 0.05f;
static constexpr size_t kPreviewLines = 500;
static constexpr int kShutdownPumps = 100;

static std::string join_args(const std::vector<std::string>& args, size_t from = 0) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) {
    if (!out.empty()) out += ' ';
    out += args[i];
  }
  return out;
}

static bool parse_index(const std::string& s, int& out) {
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return !s.empty() && res.ec == std::errc() && res.ptr == s.data() + s.size();
}

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }

Workspace::Workspace(ITerminal& term, ISurfaceHost& host, Config& cfg, Options options)
    : term_(term), host_(host), cfg_(cfg), options_(std::move(options)), registry_(host),
      occlusion_(registry_, refresh_), tabs_(this, options_.cwd), store_(cfg.session_path) {
  register_config_commands(commands_, cfg_, message_, [this](const std::string& name) {
    if (name == "session") store_.set_path(cfg_.session_path);
  });
  register_commands();
  tabs_.cwd_changed.connect([this](const std::string& dir) { current_dir_ = dir; });
  tabs_.surface_navigated.connect([this](const std::string& pane_id, const std::string& url) {
    auto it = syncs_.find(pane_id);
    if (it != syncs_.end() && !it->second->create_requested()) {
      // Not created yet: remount with the new address.
      syncs_.erase(it);
      return;
    }
    registry_.navigate(pane_id, url, [pane_id](const HostStatus& st) {
      if (!st.ok) log_warn("host", "navigate failed for " + pane_id + ": " + st.error);
    });
  });
}

Workspace::~Workspace() { shutdown(); }

void Workspace::load_rc(const std::filesystem::path& path) {
  std::string msg;
  if (!::load_rc(path, commands_, msg)) {
    message_ = msg;
    log_warn("config", msg);
  } else if (!msg.empty()) {
    message_ = msg;
  }
}

void Workspace::persist() {
  if (!cfg_.persist) return;
  std::string msg;
  if (!store_.save(tabs_, msg)) message_ = msg;
}

void Workspace::start(const std::vector<std::string>& files) {
  if (started_) return;
  started_ = true;
  store_.set_path(cfg_.session_path);
  if (cfg_.restore) store_.restore_into(tabs_);
  for (const auto& f : files) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(f, ec);
    tabs_.create_editor_tab(ec ? f : abs.string());
  }
  tabs_.changed.connect([this] { persist(); });
  persist();
}

// ---- resources ----

void Workspace::release(const PaneNode& leaf) {
  switch (leaf.kind()) {
    case PaneNode::Kind::Terminal:
      sessions_.erase(leaf.id);
      break;
    case PaneNode::Kind::WebSurface:
      syncs_.erase(leaf.id);
      registry_.destroy(leaf.id);
      break;
    case PaneNode::Kind::Editor:
      previews_.erase(leaf.id);
      break;
    default:
      break;
  }
}

const BoundsSynchronizer* Workspace::synchronizer(const std::string& pane_id) const {
  auto it = syncs_.find(pane_id);
  return it == syncs_.end() ? nullptr : it->second.get();
}

const TerminalSession* Workspace::terminal_session(const std::string& pane_id) const {
  auto it = sessions_.find(pane_id);
  return it == sessions_.end() ? nullptr : it->second.get();
}

bool Workspace::occluded() const { return occlusion_.covering(); }

std::optional<OverlayKind> Workspace::overlay_kind() const {
  if (!overlay_) return std::nullopt;
  return overlay_->kind;
}

void Workspace::mount_surface(const PaneNode& leaf, Clock::time_point now) {
  BoundsSynchronizer::Timing timing;
  timing.initial_delay = std::chrono::milliseconds(cfg_.surface_delay_ms);
  timing.retry_delay = std::chrono::milliseconds(cfg_.surface_retry_ms);
  auto sync = std::make_unique<BoundsSynchronizer>(registry_, refresh_, leaf.id, leaf.web_surface()->url, timing, now);
  sync->set_hold([this] { return occlusion_.covering(); });
  syncs_[leaf.id] = std::move(sync);
}

void Workspace::ensure_terminal(const PaneNode& leaf, const Rect& body) {
  if (!options_.spawn_processes) return;
  auto it = sessions_.find(leaf.id);
  if (it == sessions_.end()) {
    auto session = std::make_unique<TerminalSession>(leaf.id, static_cast<size_t>(cfg_.scrollback));
    std::string msg;
    if (!session->start(cfg_.shell, leaf.terminal()->cwd, body.height, body.width, msg)) {
      log_error("term", "cannot start " + cfg_.shell + ": " + msg);
      message_ = msg;
    }
    it = sessions_.emplace(leaf.id, std::move(session)).first;
  }
  it->second->resize(body.height, body.width);
}

void Workspace::reconcile(Clock::time_point now) {
  const Tab* active = tabs_.active_tab();
  bool hidden = occluded();
  std::set<std::string> web_ids, term_ids, editor_ids;
  for (const auto& tab : tabs_.tabs()) {
    bool tab_active = active && tab.id == active->id;
    for (const auto& leaf : enumerate_leaves(tab.root)) {
      if (leaf->terminal()) term_ids.insert(leaf->id);
      if (leaf->editor()) editor_ids.insert(leaf->id);
      if (!leaf->web_surface()) continue;
      web_ids.insert(leaf->id);
      if (!syncs_.count(leaf->id)) mount_surface(*leaf, now);
      BoundsSynchronizer& sync = *syncs_[leaf->id];
      if (!tab_active) sync.set_visible(false);
      else if (!hidden) sync.set_visible(true);
    }
  }
  // Leaves that left every tree without a release (cannot happen through
  // TabManager, kept as a backstop for restore paths).
  for (auto it = syncs_.begin(); it != syncs_.end();) {
    if (web_ids.count(it->first)) { ++it; continue; }
    log_warn("sync", "unmounting orphaned surface " + it->first);
    registry_.destroy(it->first);
    it = syncs_.erase(it);
  }
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    it = term_ids.count(it->first) ? std::next(it) : sessions_.erase(it);
  }
  for (auto it = previews_.begin(); it != previews_.end();) {
    it = editor_ids.count(it->first) ? std::next(it) : previews_.erase(it);
  }

  layout_.clear();
  if (!active || !active->root) return;
  TermSize sz = term_.get_size();
  collect_layout(*active->root, pane_area(sz.rows, sz.cols), layout_);
  for (const auto& pr : layout_) {
    PanePtr leaf = find_pane(active->root, pr.pane);
    if (!leaf) continue;
    Rect body = pane_body(pr.rect);
    if (leaf->terminal()) {
      if (!body.empty()) ensure_terminal(*leaf, body);
    } else if (leaf->web_surface() && !hidden) {
      syncs_[leaf->id]->observe(body, now);
    }
  }
  if (!hidden) {
    for (auto& [id, sync] : syncs_) sync->tick(now);
  }
}

// ---- frame ----

PaneView Workspace::view_for(const PaneNode& leaf, const Rect& rect, bool active) {
  PaneView v;
  v.id = leaf.id;
  v.title = leaf.title;
  v.rect = rect;
  v.active = active;
  Rect body = pane_body(rect);
  if (const TerminalContent* t = leaf.terminal()) {
    if (t->view_mode == TerminalViewMode::Blocks) v.title += " [blocks]";
    auto it = sessions_.find(leaf.id);
    if (it == sessions_.end()) {
      v.lines.push_back("[no process]");
      return v;
    }
    v.lines = it->second->tail(body.height);
    if (it->second->exited()) {
      if (!v.lines.empty()) v.lines.erase(v.lines.begin());
      v.lines.push_back("[process exited: " + std::to_string(it->second->exit_status()) + "]");
    }
    if (t->view_mode == TerminalViewMode::Blocks) {
      for (auto& l : v.lines) l = "| " + l;
    }
    return v;
  }
  if (const WebSurfaceContent* w = leaf.web_surface()) {
    if (const SurfaceSnapshot* snap = occlusion_.snapshot_for(leaf.id)) {
      v.body = PaneView::Body::Snapshot;
      if (snap->captured) v.lines = snap->image.rows;
      else v.lines.push_back("[ " + snap->url + " ]");
      return v;
    }
    const SurfaceEntry* e = registry_.find(leaf.id);
    if (e && e->state == SurfaceState::Failed) {
      v.body = PaneView::Body::Error;
      v.lines = {"surface failed: " + e->error, "url: " + e->url, "Ctrl-W r to retry"};
    } else if (e && e->state == SurfaceState::Created && e->visible) {
      v.body = PaneView::Body::Surface;
    } else if (e && e->state == SurfaceState::Created) {
      v.lines.push_back("[hidden] " + w->url);
    } else {
      v.lines.push_back("loading " + w->url);
    }
    return v;
  }
  if (const WidgetContent* wd = leaf.widget()) {
    v.lines.push_back("widget: " + wd->widget_type);
    if (!wd->config.is_null()) {
      std::istringstream iss(wd->config.dump(2));
      for (std::string l; std::getline(iss, l);) v.lines.push_back(l);
    }
    return v;
  }
  if (const EditorContent* ed = leaf.editor()) {
    if (ed->read_only) v.title += " [ro]";
    auto it = previews_.find(leaf.id);
    if (it == previews_.end()) {
      std::vector<std::string> lines;
      std::string msg;
      if (!read_file_lines(ed->file_path, lines, msg, kPreviewLines)) {
        lines = {msg};
        log_warn("tabs", msg);
      }
      it = previews_.emplace(leaf.id, std::move(lines)).first;
    }
    v.lines = it->second;
  }
  return v;
}

std::vector<std::string> Workspace::settings_items() const {
  return {
      std::string("restore session: ") + (cfg_.restore ? "on" : "off"),
      std::string("persist session: ") + (cfg_.persist ? "on" : "off"),
      "session file: " + cfg_.session_path.string(),
      "shell: " + cfg_.shell,
      "surface delay: " + std::to_string(cfg_.surface_delay_ms) + " ms",
      "surface retry: " + std::to_string(cfg_.surface_retry_ms) + " ms",
      "scrollback: " + std::to_string(cfg_.scrollback),
  };
}

FrameView Workspace::build_frame() {
  FrameView f;
  for (const auto& t : tabs_.tabs()) {
    TabBarEntry e;
    e.title = t.title;
    e.active = t.id == tabs_.active_tab_id();
    e.pinned = t.pinned;
    e.pin_icon = t.pin_icon;
    e.color = t.pinned && t.pin_color ? t.pin_color : t.tab_color;
    f.tabs.push_back(std::move(e));
  }
  if (const Tab* tab = tabs_.active_tab()) {
    for (const auto& pr : layout_) {
      PanePtr leaf = find_pane(tab->root, pr.pane);
      if (leaf) f.panes.push_back(view_for(*leaf, pr.rect, pr.pane == tabs_.active_pane_id()));
    }
  }
  if (overlay_) {
    OverlayView o;
    o.title = to_string(overlay_->kind);
    o.items = overlay_->items;
    o.selected = overlay_->selected;
    if (overlay_->kind == OverlayKind::SurfaceUrlPopover) o.input = overlay_->input;
    f.overlay = std::move(o);
  } else if (settings_open_ && occlusion_.modal_open()) {
    f.overlay = OverlayView{"settings", settings_items(), settings_selected_, std::nullopt};
  }
  f.status = message_.empty() ? current_dir_ : message_;
  f.command_mode = mode_ == Mode::Command;
  f.cmdline = cmdline_;
  return f;
}

void Workspace::step(Clock::time_point now) {
  now_ = now;
  host_.pump();
  registry_.pump();
  for (auto& [id, s] : sessions_) s->poll();
  reconcile(now);
  registry_.pump();
  std::string status = Log::take_status();
  if (!status.empty()) message_ = status;
  renderer_.render(term_, build_frame());
  host_.composite();
  term_.present();
}

void Workspace::run(const KeySource& keys) {
  while (!should_quit_) {
    step(Clock::now());
    int ch = keys(30);
    while (ch >= 0 && !should_quit_) {
      handle_key(ch);
      ch = keys(0);
    }
  }
  shutdown();
}

void Workspace::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  syncs_.clear();
  registry_.destroy_all();
  for (int i = 0; i < kShutdownPumps && !registry_.idle(); ++i) {
    host_.pump();
    registry_.pump();
  }
  if (!registry_.idle()) log_warn("registry", "surfaces still busy at exit");
  sessions_.clear();
}

// ---- input ----

void Workspace::handle_key(int ch) {
  switch (mode_) {
    case Mode::Normal: handle_normal_key(ch); break;
    case Mode::Command: handle_command_key(ch); break;
    case Mode::Overlay: handle_overlay_key(ch); break;
    case Mode::Settings: handle_settings_key(ch); break;
  }
}

void Workspace::handle_normal_key(int ch) {
  auto a = input_.feed(ch);
  if (a) apply_action(*a);
}

void Workspace::apply_action(const KeyAction& a) {
  message_.clear();
  switch (a.action) {
    case Action::Forward: forward_to_pane(a.key); break;
    case Action::SplitRight: split(SplitDirection::Vertical, std::nullopt); break;
    case Action::SplitDown: split(SplitDirection::Horizontal, std::nullopt); break;
    case Action::ClosePane:
      if (!tabs_.close_active_pane()) message_ = "last pane of the tab (use :tabclose)";
      break;
    case Action::FocusLeft: focus_direction('h'); break;
    case Action::FocusDown: focus_direction('j'); break;
    case Action::FocusUp: focus_direction('k'); break;
    case Action::FocusRight: focus_direction('l'); break;
    case Action::FocusNext: tabs_.focus_next_pane(1); break;
    case Action::NewTab: tabs_.create_tab(); break;
    case Action::CloseTab: tabs_.close_tab(tabs_.active_tab_id()); break;
    case Action::NextTab: tabs_.next_tab(1); break;
    case Action::PrevTab: tabs_.next_tab(-1); break;
    case Action::SelectTab: tabs_.set_active_tab_index(a.index); break;
    case Action::NarrowSplit: resize_active(-kResizeStep); break;
    case Action::WidenSplit: resize_active(kResizeStep); break;
    case Action::SplitMenu: {
      OverlayState st;
      st.kind = OverlayKind::SplitMenu;
      st.items = {"Split right: terminal", "Split down: terminal", "Split right: web page...",
                  "Split down: web page...", "New tab: web page..."};
      st.target = tabs_.active_pane_id();
      open_overlay(std::move(st));
      break;
    }
    case Action::TabMenu: {
      const Tab* tab = tabs_.active_tab();
      if (!tab) break;
      OverlayState st;
      st.kind = OverlayKind::TabContextMenu;
      st.items = {tab->pinned ? "Unpin tab" : "Pin tab", "Rename tab", "Tab color...", "Close tab"};
      st.target = tab->id;
      open_overlay(std::move(st));
      break;
    }
    case Action::UrlPopover: {
      PanePtr p = tabs_.active_pane();
      if (!p || !p->web_surface()) { message_ = "not a web pane"; break; }
      open_url_popover(UrlPurpose::Navigate);
      break;
    }
    case Action::Settings: open_settings(); break;
    case Action::RetrySurface:
      if (!registry_.retry(tabs_.active_pane_id())) message_ = "nothing to retry";
      break;
    case Action::CommandLine:
      mode_ = Mode::Command;
      cmdline_.clear();
      break;
  }
}

void Workspace::forward_to_pane(int ch) {
  auto it = sessions_.find(tabs_.active_pane_id());
  if (it == sessions_.end() || !it->second->running()) return;
  std::string bytes;
  switch (ch) {
    case KEY_BACKSPACE: bytes = "\x7f"; break;
    case KEY_ENTER: bytes = "\r"; break;
    case KEY_UP: bytes = "\x1b[A"; break;
    case KEY_DOWN: bytes = "\x1b[B"; break;
    case KEY_RIGHT: bytes = "\x1b[C"; break;
    case KEY_LEFT: bytes = "\x1b[D"; break;
    case KEY_HOME: bytes = "\x1b[H"; break;
    case KEY_END: bytes = "\x1b[F"; break;
    case KEY_DC: bytes = "\x1b[3~"; break;
    default:
      if (ch >= 0 && ch < 256) bytes.push_back(static_cast<char>(ch));
      break;
  }
  if (bytes.empty()) return;
  std::string msg;
  if (!it->second->write(bytes, msg)) message_ = msg;
}

void Workspace::handle_command_key(int ch) {
  if (ch == kEsc) { mode_ = Mode::Normal; cmdline_.clear(); return; }
  if (is_enter(ch)) {
    mode_ = Mode::Normal;
    std::string line = cmdline_;
    cmdline_.clear();
    message_.clear();
    execute_command(line);
    return;
  }
  if (is_backspace(ch)) {
    if (cmdline_.empty()) mode_ = Mode::Normal;
    else cmdline_.pop_back();
    return;
  }
  if (ch >= 32 && ch <= 126) cmdline_.push_back(static_cast<char>(ch));
}

bool Workspace::execute_command(const std::string& line) {
  std::string err;
  if (!commands_.dispatch(line, err)) {
    message_ = err;
    return false;
  }
  return true;
}

// ---- panes ----

void Workspace::split(SplitDirection dir, const std::optional<PaneSpec>& content) {
  std::string msg;
  if (!tabs_.split_active_pane(dir, content, msg)) message_ = msg;
}

void Workspace::focus_direction(char dir) {
  if (layout_.size() <= 1) return;
  const std::string& active = tabs_.active_pane_id();
  Rect cur_rect{};
  bool found = false;
  for (const auto& pr : layout_) if (pr.pane == active) { cur_rect = pr.rect; found = true; break; }
  if (!found) return;
  auto center = [](const Rect& r) { return std::pair<int, int>{r.row + r.height / 2, r.col + r.width / 2}; };
  auto [cr, cc] = center(cur_rect);
  std::string best;
  int best_score = std::numeric_limits<int>::max();
  for (const auto& pr : layout_) {
    if (pr.pane == active) continue;
    auto [rr, rc] = center(pr.rect);
    int dr = rr - cr;
    int dc = rc - cc;
    bool ok = false;
    switch (dir) {
      case 'h': ok = (dc < 0); break;
      case 'l': ok = (dc > 0); break;
      case 'k': ok = (dr < 0); break;
      case 'j': ok = (dr > 0); break;
      default: break;
    }
    if (!ok) continue;
    int score = dr * dr + dc * dc;
    if (score < best_score) { best_score = score; best = pr.pane; }
  }
  if (!best.empty()) tabs_.set_active_pane(best);
  else tabs_.focus_next_pane(1);
}

void Workspace::resize_active(float delta) {
  const Tab* tab = tabs_.active_tab();
  if (!tab) return;
  PanePtr parent = find_parent_split(tab->root, tabs_.active_pane_id());
  if (!parent) { message_ = "no split to resize"; return; }
  const SplitContent* s = parent->split();
  bool first = s->first && s->first->id == tabs_.active_pane_id();
  tabs_.resize_split(parent->id, s->ratio + (first ? delta : -delta));
}

// ---- overlays ----

void Workspace::open_overlay(OverlayState st) {
  std::optional<OverlayKind> previous = overlay_kind();
  // Count the new overlay before the old one goes so surfaces stay hidden.
  occlusion_.open_overlay(st.kind);
  overlay_ = std::move(st);
  mode_ = Mode::Overlay;
  if (previous) occlusion_.close_overlay(*previous);
}

void Workspace::close_overlay() {
  if (!overlay_) return;
  OverlayKind kind = overlay_->kind;
  overlay_.reset();
  mode_ = Mode::Normal;
  occlusion_.close_overlay(kind);
}

void Workspace::open_url_popover(UrlPurpose purpose) {
  OverlayState st;
  st.kind = OverlayKind::SurfaceUrlPopover;
  st.purpose = purpose;
  st.target = tabs_.active_pane_id();
  if (purpose == UrlPurpose::Navigate) {
    if (PanePtr p = tabs_.active_pane(); p && p->web_surface()) st.input = p->web_surface()->url;
  }
  open_overlay(std::move(st));
}

void Workspace::handle_overlay_key(int ch) {
  if (!overlay_) { mode_ = Mode::Normal; return; }
  if (ch == kEsc) { close_overlay(); return; }
  if (is_enter(ch)) { choose_overlay_item(); return; }
  if (overlay_->kind == OverlayKind::SurfaceUrlPopover) {
    if (is_backspace(ch)) { if (!overlay_->input.empty()) overlay_->input.pop_back(); }
    else if (ch >= 32 && ch <= 126) overlay_->input.push_back(static_cast<char>(ch));
    return;
  }
  int n = static_cast<int>(overlay_->items.size());
  if (ch == KEY_UP || ch == 'k') overlay_->selected = std::max(0, overlay_->selected - 1);
  else if (ch == KEY_DOWN || ch == 'j') overlay_->selected = std::min(n - 1, overlay_->selected + 1);
}

void Workspace::choose_overlay_item() {
  OverlayState st = *overlay_;
  std::string msg;
  switch (st.kind) {
    case OverlayKind::SplitMenu:
      switch (st.selected) {
        case 0: close_overlay(); split(SplitDirection::Vertical, std::nullopt); break;
        case 1: close_overlay(); split(SplitDirection::Horizontal, std::nullopt); break;
        case 2: open_url_popover(UrlPurpose::SplitRight); break;
        case 3: open_url_popover(UrlPurpose::SplitDown); break;
        default: open_url_popover(UrlPurpose::NewTab); break;
      }
      return;
    case OverlayKind::TabContextMenu:
      if (st.selected == 2) {
        OverlayState picker;
        picker.kind = OverlayKind::StylePicker;
        for (TabColor c : {TabColor::Cyan, TabColor::Green, TabColor::Yellow, TabColor::Orange, TabColor::Red,
                           TabColor::Magenta, TabColor::Blue, TabColor::White})
          picker.items.push_back(to_string(c));
        picker.target = st.target;
        open_overlay(std::move(picker));
        return;
      }
      close_overlay();
      if (st.selected == 0) tabs_.toggle_pin_tab(st.target);
      else if (st.selected == 1) { mode_ = Mode::Command; cmdline_ = "tabname "; }
      else tabs_.close_tab(st.target);
      return;
    case OverlayKind::StylePicker: {
      close_overlay();
      if (st.selected < 0 || st.selected >= static_cast<int>(st.items.size())) return;
      auto color = parse_tab_color(st.items[static_cast<size_t>(st.selected)]);
      const Tab* tab = tabs_.find_tab(st.target);
      if (!tab || !color) return;
      if (tab->pinned) tabs_.update_pinned_tab_style(st.target, std::nullopt, color, std::nullopt);
      else tabs_.update_tab_style(st.target, color, std::nullopt);
      return;
    }
    case OverlayKind::SurfaceUrlPopover: {
      close_overlay();
      bool ok = true;
      std::string url = normalize_address_input(st.input);
      switch (st.purpose) {
        case UrlPurpose::Navigate: ok = tabs_.navigate_pane(st.target, st.input, msg); break;
        case UrlPurpose::SplitRight:
          ok = tabs_.split_active_pane_with_surface(SplitDirection::Vertical, url, std::nullopt, msg);
          break;
        case UrlPurpose::SplitDown:
          ok = tabs_.split_active_pane_with_surface(SplitDirection::Horizontal, url, std::nullopt, msg);
          break;
        case UrlPurpose::NewTab: ok = tabs_.create_web_tab(url, std::nullopt, msg).has_value(); break;
      }
      if (!ok) message_ = msg;
      return;
    }
  }
}

// ---- settings (modal) ----

void Workspace::open_settings() {
  if (occlusion_.modal_phase() != OcclusionCoordinator::ModalPhase::Closed) return;
  settings_open_ = true;
  settings_selected_ = 0;
  mode_ = Mode::Settings;
  occlusion_.begin_modal([] { log_info("occlusion", "settings dialog open"); });
}

void Workspace::close_settings() {
  settings_open_ = false;
  mode_ = Mode::Normal;
  if (occlusion_.modal_phase() == OcclusionCoordinator::ModalPhase::Capturing) occlusion_.cancel_modal();
  else occlusion_.end_modal();
}

void Workspace::handle_settings_key(int ch) {
  if (ch == kEsc || ch == 'q') { close_settings(); return; }
  if (!occlusion_.modal_open()) return;
  int n = static_cast<int>(settings_items().size());
  if (ch == KEY_UP || ch == 'k') settings_selected_ = std::max(0, settings_selected_ - 1);
  else if (ch == KEY_DOWN || ch == 'j') settings_selected_ = std::min(n - 1, settings_selected_ + 1);
  else if (is_enter(ch) || ch == ' ') {
    if (settings_selected_ == 0) execute_command("set restore");
    else if (settings_selected_ == 1) execute_command("set persist");
  }
}

// ---- ex commands ----

void Workspace::register_commands() {
  commands_.register_command("q", [this](const std::vector<std::string>&) { should_quit_ = true; });
  commands_.register_command("tabnew", [this](const std::vector<std::string>& args) {
    if (args.empty()) tabs_.create_tab();
    else tabs_.create_tab(join_args(args));
  });
  commands_.register_command("tabclose", [this](const std::vector<std::string>&) {
    tabs_.close_tab(tabs_.active_tab_id());
  });
  commands_.register_command("tabmove", [this](const std::vector<std::string>& args) {
    int from = 0, to = 0;
    if (args.size() != 2 || !parse_index(args[0], from) || !parse_index(args[1], to)) {
      message_ = "tabmove: use :tabmove FROM TO";
      return;
    }
    if (!tabs_.reorder_tab(from - 1, to - 1)) message_ = "tabmove: no such tab";
  });
  commands_.register_command("tabname", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "tabname: use :tabname TITLE"; return; }
    tabs_.rename_tab(tabs_.active_tab_id(), join_args(args));
  });
  commands_.register_command("pin", [this](const std::vector<std::string>&) {
    if (!tabs_.pin_tab(tabs_.active_tab_id())) message_ = "tab already pinned";
  });
  commands_.register_command("unpin", [this](const std::vector<std::string>&) {
    if (!tabs_.unpin_tab(tabs_.active_tab_id())) message_ = "tab is not pinned";
  });
  commands_.register_command("pinstyle", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "pinstyle: use :pinstyle ICON [COLOR [BG]]"; return; }
    auto icon = parse_pin_icon(args[0]);
    std::optional<TabColor> color, bg;
    if (args.size() > 1) color = parse_tab_color(args[1]);
    if (args.size() > 2) bg = parse_tab_color(args[2]);
    if (!icon || (args.size() > 1 && !color) || (args.size() > 2 && !bg)) { message_ = "pinstyle: unknown icon or color"; return; }
    if (!tabs_.update_pinned_tab_style(tabs_.active_tab_id(), icon, color, bg)) message_ = "pinstyle: tab is not pinned";
  });
  commands_.register_command("tabstyle", [this](const std::vector<std::string>& args) {
    std::optional<TabColor> color, bg;
    if (!args.empty()) color = parse_tab_color(args[0]);
    if (args.size() > 1) bg = parse_tab_color(args[1]);
    if ((!args.empty() && !color) || (args.size() > 1 && !bg)) { message_ = "tabstyle: unknown color"; return; }
    tabs_.update_tab_style(tabs_.active_tab_id(), color, bg);
  });
  commands_.register_command("split", [this](const std::vector<std::string>&) { split(SplitDirection::Horizontal, std::nullopt); });
  commands_.register_command("vsplit", [this](const std::vector<std::string>&) { split(SplitDirection::Vertical, std::nullopt); });
  commands_.register_command("web", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "web: use :web URL"; return; }
    std::string msg;
    if (!tabs_.create_web_tab(normalize_address_input(args[0]), std::nullopt, msg)) message_ = msg;
  });
  auto web_split = [this](SplitDirection dir) {
    return [this, dir](const std::vector<std::string>& args) {
      if (args.empty()) { message_ = "use :vweb URL or :hweb URL"; return; }
      std::string msg;
      if (!tabs_.split_active_pane_with_surface(dir, normalize_address_input(args[0]), std::nullopt, msg)) message_ = msg;
    };
  };
  commands_.register_command("vweb", web_split(SplitDirection::Vertical));
  commands_.register_command("hweb", web_split(SplitDirection::Horizontal));
  commands_.register_command("edit", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "edit: use :edit PATH"; return; }
    std::error_code ec;
    auto abs = std::filesystem::absolute(args[0], ec);
    tabs_.create_editor_tab(ec ? args[0] : abs.string());
  });
  commands_.register_command("widget", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "widget: use :widget TYPE"; return; }
    tabs_.create_widget_tab(args[0]);
  });
  commands_.register_command("open", [this](const std::vector<std::string>& args) {
    if (args.empty()) { message_ = "open: use :open URL"; return; }
    std::string msg;
    if (!tabs_.navigate_pane(tabs_.active_pane_id(), join_args(args), msg)) message_ = msg;
  });
  commands_.register_command("viewmode", [this](const std::vector<std::string>& args) {
    auto mode = args.empty() ? std::nullopt : parse_view_mode(args[0]);
    if (!mode) { message_ = "viewmode: use :viewmode classic|blocks"; return; }
    if (!tabs_.update_terminal_view_mode(tabs_.active_pane_id(), *mode)) message_ = "viewmode: not a terminal pane";
  });
  commands_.register_command("close", [this](const std::vector<std::string>&) {
    if (!tabs_.close_active_pane()) message_ = "last pane of the tab (use :tabclose)";
  });
  commands_.register_command("settings", [this](const std::vector<std::string>&) { open_settings(); });
  commands_.register_command("retry", [this](const std::vector<std::string>&) {
    if (!registry_.retry(tabs_.active_pane_id())) message_ = "nothing to retry";
  });
}
