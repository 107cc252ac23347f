#include "session_store.hpp"
#include <cstdlib>
#include "file_io.hpp"
#include "log.hpp"
#include "pane_layout.hpp"
#include "url_validator.hpp"

using nlohmann::json;

json serialize_pane(const PaneNode& node) {
  json j;
  switch (node.kind()) {
    case PaneNode::Kind::Terminal: {
      const TerminalContent& t = *node.terminal();
      j["type"] = "terminal";
      j["title"] = node.title;
      if (t.cwd) j["cwd"] = *t.cwd;
      if (t.view_mode != TerminalViewMode::Classic) j["viewMode"] = to_string(t.view_mode);
      break;
    }
    case PaneNode::Kind::WebSurface:
      j["type"] = "webview";
      j["title"] = node.title;
      j["url"] = node.web_surface()->url;
      break;
    case PaneNode::Kind::Widget: {
      const WidgetContent& w = *node.widget();
      j["type"] = "widget";
      j["title"] = node.title;
      j["widgetType"] = w.widget_type;
      if (!w.config.is_null()) j["config"] = w.config;
      break;
    }
    case PaneNode::Kind::Editor: {
      const EditorContent& e = *node.editor();
      j["type"] = "editor";
      j["title"] = node.title;
      j["filePath"] = e.file_path;
      if (e.language) j["language"] = *e.language;
      if (e.read_only) j["isReadOnly"] = true;
      break;
    }
    case PaneNode::Kind::Split: {
      const SplitContent& s = *node.split();
      j["type"] = "split";
      j["direction"] = to_string(s.direction);
      j["ratio"] = s.ratio;
      j["first"] = serialize_pane(*s.first);
      j["second"] = serialize_pane(*s.second);
      break;
    }
  }
  return j;
}

json serialize_session(const std::vector<Tab>& tabs, int active_tab_index) {
  json list = json::array();
  for (const auto& tab : tabs) {
    json t;
    t["title"] = tab.title;
    t["isPinned"] = tab.pinned;
    if (tab.pin_icon) t["pinIcon"] = to_string(*tab.pin_icon);
    if (tab.pin_color) t["pinColor"] = to_string(*tab.pin_color);
    if (tab.pin_background_color) t["pinBackgroundColor"] = to_string(*tab.pin_background_color);
    if (tab.tab_color) t["tabColor"] = to_string(*tab.tab_color);
    if (tab.tab_background_color) t["tabBackgroundColor"] = to_string(*tab.tab_background_color);
    if (tab.resource_path) t["resourcePath"] = *tab.resource_path;
    t["root"] = serialize_pane(*tab.root);
    list.push_back(std::move(t));
  }
  json j;
  j["version"] = kSessionVersion;
  j["tabs"] = std::move(list);
  j["activeTabIndex"] = active_tab_index < 0 ? 0 : active_tab_index;
  return j;
}

static std::string string_or(const json& j, const char* key, const std::string& fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  std::string s = it->get<std::string>();
  return s.empty() ? fallback : s;
}

static std::optional<std::string> optional_string(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

template <typename T>
static std::optional<T> optional_enum(const json& j, const char* key, std::optional<T> (*parse)(const std::string&)) {
  auto s = optional_string(j, key);
  return s ? parse(*s) : std::nullopt;
}

PanePtr deserialize_pane(const json& record, IdGenerator& pane_ids, int depth) {
  if (!record.is_object()) return nullptr;
  if (depth > kMaxPaneDepth) {
    log_warn("session", "pane tree nested deeper than " + std::to_string(kMaxPaneDepth));
    return nullptr;
  }
  std::string type = record.at("type").get<std::string>();
  if (type == "terminal") {
    auto mode = optional_enum<TerminalViewMode>(record, "viewMode", parse_view_mode);
    return make_terminal_pane(pane_ids.next(), string_or(record, "title", "Terminal"), optional_string(record, "cwd"),
                              mode.value_or(TerminalViewMode::Classic));
  }
  if (type == "webview") {
    std::string title = string_or(record, "title", "Web");
    std::string url = string_or(record, "url", kBlankSurfaceUrl);
    std::string msg;
    if (url != kBlankSurfaceUrl && !validate_surface_url(url, msg)) {
      log_warn("session", "invalid stored URL, using about:blank: " + msg);
      url = kBlankSurfaceUrl;
    }
    return make_web_pane(pane_ids.next(), title, url);
  }
  if (type == "widget") {
    json config = record.contains("config") ? record.at("config") : json(nullptr);
    return make_widget_pane(pane_ids.next(), string_or(record, "title", "Widget"),
                            string_or(record, "widgetType", "unknown"), std::move(config));
  }
  if (type == "editor") {
    bool read_only = record.contains("isReadOnly") && record.at("isReadOnly").get<bool>();
    return make_editor_pane(pane_ids.next(), string_or(record, "title", "Editor"), string_or(record, "filePath", ""),
                            optional_string(record, "language"), read_only);
  }
  if (type == "split") {
    auto dir = optional_enum<SplitDirection>(record, "direction", parse_split_direction);
    float ratio = record.contains("ratio") ? record.at("ratio").get<float>() : 0.5f;
    std::string id = pane_ids.next();
    PanePtr first = deserialize_pane(record.at("first"), pane_ids, depth + 1);
    if (!first) return nullptr;
    PanePtr second = deserialize_pane(record.at("second"), pane_ids, depth + 1);
    if (!first || !second) return nullptr;
    return make_split_pane(std::move(id), dir.value_or(SplitDirection::Horizontal), std::move(first),
                           std::move(second), ratio);
  }
  log_warn("session", "unknown pane type: " + type);
  return nullptr;
}

bool deserialize_session(const json& record, IdGenerator& tab_ids, IdGenerator& pane_ids, SessionData& out,
                         std::string& msg) {
  out = SessionData{};
  if (!record.is_object()) { msg = "session record is not an object"; return false; }
  auto version = record.find("version");
  if (version == record.end() || !version->is_number_integer() || version->get<int>() != kSessionVersion) {
    msg = "unsupported session version";
    return false;
  }
  auto tabs = record.find("tabs");
  if (tabs == record.end() || !tabs->is_array() || tabs->empty()) { msg = "session has no tabs"; return false; }
  auto active = record.find("activeTabIndex");
  if (active == record.end() || !active->is_number()) { msg = "session has no active tab index"; return false; }
  for (const auto& t : *tabs) {
    if (!t.is_object() || string_or(t, "title", "").empty() || !t.contains("root")) {
      msg = "corrupted tab record";
      return false;
    }
  }

  std::vector<Tab> restored;
  try {
    int order = 0;
    for (const auto& t : *tabs) {
      Tab tab;
      tab.id = tab_ids.next();
      tab.title = t.at("title").get<std::string>();
      tab.root = deserialize_pane(t.at("root"), pane_ids);
      if (!tab.root) { msg = "corrupted pane record"; return false; }
      tab.order = order++;
      tab.pinned = t.contains("isPinned") && t.at("isPinned").is_boolean() && t.at("isPinned").get<bool>();
      tab.pin_icon = optional_enum<PinIcon>(t, "pinIcon", parse_pin_icon);
      tab.pin_color = optional_enum<TabColor>(t, "pinColor", parse_tab_color);
      tab.pin_background_color = optional_enum<TabColor>(t, "pinBackgroundColor", parse_tab_color);
      tab.tab_color = optional_enum<TabColor>(t, "tabColor", parse_tab_color);
      tab.tab_background_color = optional_enum<TabColor>(t, "tabBackgroundColor", parse_tab_color);
      tab.resource_path = optional_string(t, "resourcePath");
      restored.push_back(std::move(tab));
    }
  } catch (const json::exception& e) {
    msg = std::string("corrupted pane record: ") + e.what();
    return false;
  }

  for (const auto& tab : restored) {
    if (!check_tree(tab.root, msg)) return false;
  }
  int n = static_cast<int>(restored.size());
  // clamp before narrowing; stored numbers may be anything JSON allows
  double index = active->get<double>();
  out.active_tab_index = index >= n - 1 ? n - 1 : (index > 0 ? static_cast<int>(index) : 0);
  out.tabs = std::move(restored);
  return true;
}

std::filesystem::path default_session_path() {
  if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state)
    return std::filesystem::path(state) / "mtile" / "session.json";
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
  return base / ".local" / "state" / "mtile" / "session.json";
}

SessionStore::SessionStore(std::filesystem::path path) : path_(std::move(path)) {}

bool SessionStore::save(const TabManager& tabs, std::string& msg) {
  std::string data = serialize_session(tabs.tabs(), tabs.active_tab_index()).dump(2);
  data.push_back('\n');
  if (!write_file_atomic(path_, data, msg)) {
    log_warn("session", "failed to save session: " + msg);
    return false;
  }
  ++writes_;
  return true;
}

bool SessionStore::load(IdGenerator& tab_ids, IdGenerator& pane_ids, SessionData& out, std::string& msg) {
  out = SessionData{};
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) { msg = "no stored session"; return false; }
  std::string text;
  if (!read_file_text(path_, text, msg)) return false;
  json record = json::parse(text, nullptr, false);
  if (record.is_discarded()) { msg = "session record is not valid JSON"; return false; }
  return deserialize_session(record, tab_ids, pane_ids, out, msg);
}

bool SessionStore::restore_into(TabManager& tabs) {
  SessionData data;
  std::string msg;
  if (!load(tabs.tab_ids(), tabs.pane_ids(), data, msg)) {
    // The manager already holds its fresh default tab.
    if (msg != "no stored session") log_warn("session", "invalid session, resetting: " + msg);
    return false;
  }
  log_info("session", "restored session with " + std::to_string(data.tabs.size()) + " tabs");
  tabs.restore(std::move(data.tabs), data.active_tab_index);
  return true;
}
