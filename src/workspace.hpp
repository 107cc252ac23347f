#pragma once
/*
 * Workspace
 *
 * Purpose: the application object. Owns the tab manager, the surface registry,
 * the occlusion coordinator, terminal processes and per-surface bounds
 * synchronizers, and runs the UI loop (input → mutate → layout → draw).
 * Rules:
 *   - web leaves of every tab keep their surface; inactive tabs park it off-screen
 *   - while an overlay or modal is up no surface is created or shown
 *   - every tree or active-tab change is written to the session store
 */
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "bounds_synchronizer.hpp"
#include "cmd_registry.hpp"
#include "config.hpp"
#include "input.hpp"
#include "isurface_host.hpp"
#include "iterminal.hpp"
#include "occlusion_coordinator.hpp"
#include "pane_layout.hpp"
#include "renderer.hpp"
#include "session_store.hpp"
#include "signal.hpp"
#include "surface_registry.hpp"
#include "tab_manager.hpp"
#include "terminal_session.hpp"

class Workspace : public IPaneResources {
public:
  using Clock = std::chrono::steady_clock;
  using KeySource = std::function<int(int timeout_ms)>;

  struct Options {
    bool spawn_processes = true;
    CwdProvider cwd = process_cwd_provider();
  };

  Workspace(ITerminal& term, ISurfaceHost& host, Config& cfg, Options options);
  ~Workspace() override;

  // rc commands run before start(); missing file is fine.
  void load_rc(const std::filesystem::path& path);
  // Restores the stored session (when enabled), opens `files` as editor tabs
  // and starts persisting.
  void start(const std::vector<std::string>& files);
  void run(const KeySource& keys);
  // One loop iteration without input: host/registry pumps, layout, draw.
  void step(Clock::time_point now);
  void handle_key(int ch);
  bool execute_command(const std::string& line);
  // Destroys surfaces and terminal processes; pumps the host until idle.
  void shutdown();

  void release(const PaneNode& leaf) override;

  TabManager& tabs() { return tabs_; }
  SurfaceRegistry& registry() { return registry_; }
  OcclusionCoordinator& occlusion() { return occlusion_; }
  CommandRegistry& commands() { return commands_; }
  SessionStore& session() { return store_; }
  Signal<>& refresh_signal() { return refresh_; }
  const std::string& message() const { return message_; }
  const std::string& current_directory() const { return current_dir_; }
  bool should_quit() const { return should_quit_; }
  bool occluded() const;
  bool settings_open() const { return settings_open_; }
  std::optional<OverlayKind> overlay_kind() const;
  const BoundsSynchronizer* synchronizer(const std::string& pane_id) const;
  const TerminalSession* terminal_session(const std::string& pane_id) const;
  // Active tab rects from the last step().
  const std::vector<PaneRect>& layout() const { return layout_; }

private:
  enum class Mode { Normal, Command, Overlay, Settings };
  enum class UrlPurpose { Navigate, SplitRight, SplitDown, NewTab };

  struct OverlayState {
    OverlayKind kind = OverlayKind::SplitMenu;
    std::vector<std::string> items;
    int selected = 0;
    std::string input;
    UrlPurpose purpose = UrlPurpose::Navigate;
    std::string target; // tab or pane id the overlay acts on
  };

  void register_commands();
  void persist();
  void reconcile(Clock::time_point now);
  void mount_surface(const PaneNode& leaf, Clock::time_point now);
  void ensure_terminal(const PaneNode& leaf, const Rect& body);
  PaneView view_for(const PaneNode& leaf, const Rect& rect, bool active);
  FrameView build_frame();

  void handle_normal_key(int ch);
  void handle_command_key(int ch);
  void handle_overlay_key(int ch);
  void handle_settings_key(int ch);
  void apply_action(const KeyAction& a);
  void forward_to_pane(int ch);

  void split(SplitDirection dir, const std::optional<PaneSpec>& content);
  void focus_direction(char dir);
  void resize_active(float delta);
  void open_overlay(OverlayState st);
  void close_overlay();
  void choose_overlay_item();
  void open_url_popover(UrlPurpose purpose);
  void open_settings();
  void close_settings();
  std::vector<std::string> settings_items() const;

  ITerminal& term_;
  ISurfaceHost& host_;
  Config& cfg_;
  Options options_;
  Signal<> refresh_;
  SurfaceRegistry registry_;
  OcclusionCoordinator occlusion_;
  TabManager tabs_;
  SessionStore store_;
  Renderer renderer_;
  Input input_;
  CommandRegistry commands_;

  std::map<std::string, std::unique_ptr<BoundsSynchronizer>> syncs_;
  std::map<std::string, std::unique_ptr<TerminalSession>> sessions_;
  std::map<std::string, std::vector<std::string>> previews_;
  std::vector<PaneRect> layout_;

  Mode mode_ = Mode::Normal;
  std::optional<OverlayState> overlay_;
  bool settings_open_ = false;
  int settings_selected_ = 0;
  std::string message_;
  std::string cmdline_;
  std::string current_dir_;
  bool started_ = false;
  bool should_quit_ = false;
  bool shut_down_ = false;
  Clock::time_point now_ = Clock::now();
};
