#pragma once
/*
 * SessionStore
 *
 * Purpose: durable record of all tabs and their pane trees.
 * Record: { version: 1, tabs: [ { title, isPinned, pinIcon?, ..., root } ], activeTabIndex }
 * Pane records carry a "type" discriminator and no ids; ids are regenerated
 * on restore.
 * Rules:
 *   - any structural problem discards the whole record (no partial recovery)
 *   - stored web addresses are re-validated; failures become about:blank
 *   - split ratios are clamped into [0.1, 0.9]
 *   - unknown icon/color names are dropped
 */
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "id_generator.hpp"
#include "tab_manager.hpp"

inline constexpr int kSessionVersion = 1;
// Split nesting beyond this is treated as a corrupted record.
inline constexpr int kMaxPaneDepth = 64;

struct SessionData {
  std::vector<Tab> tabs;
  int active_tab_index = 0;
};

nlohmann::json serialize_pane(const PaneNode& node);
nlohmann::json serialize_session(const std::vector<Tab>& tabs, int active_tab_index);

// nullptr for unknown types or missing children. Throws nlohmann::json::exception
// on type mismatches; callers go through deserialize_session.
PanePtr deserialize_pane(const nlohmann::json& record, IdGenerator& pane_ids, int depth = 0);
// false (with msg) when the record is unusable; `out` is then left empty.
bool deserialize_session(const nlohmann::json& record, IdGenerator& tab_ids, IdGenerator& pane_ids,
                         SessionData& out, std::string& msg);

// Default location: $XDG_STATE_HOME/mtile/session.json, else ~/.local/state/mtile/session.json.
std::filesystem::path default_session_path();

class SessionStore {
public:
  explicit SessionStore(std::filesystem::path path);

  bool save(const TabManager& tabs, std::string& msg);
  // false when nothing usable is stored (missing file, corrupt record).
  bool load(IdGenerator& tab_ids, IdGenerator& pane_ids, SessionData& out, std::string& msg);
  // Start-up restore. On failure `tabs` keeps its single fresh terminal tab.
  bool restore_into(TabManager& tabs);

  void set_path(std::filesystem::path path) { path_ = std::move(path); }
  const std::filesystem::path& path() const { return path_; }
  size_t writes() const { return writes_; }

private:
  std::filesystem::path path_;
  size_t writes_ = 0;
};
