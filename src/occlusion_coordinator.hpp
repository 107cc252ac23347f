#pragma once
/*
 * OcclusionCoordinator
 *
 * Purpose: let in-app overlays appear above native surfaces, which the host
 * always composites above the application's own drawing.
 * Policy:
 *   - any transient overlay hides every surface (no per-overlay hit testing);
 *     closing the last one broadcasts "refresh positions"
 *   - modal dialogs hide in two phases per surface: capture → show the frozen
 *     image in the pane → move the surface off-screen. The dialog becomes
 *     visible only when every surface reached Hidden. A failed capture still
 *     hides (placeholder shows the URL).
 *   - closing the dialog moves surfaces back first, then drops the images,
 *     and broadcasts "refresh positions" when no overlay is left
 *   - while covering(), refresh requests from anyone leave surfaces hidden
 */
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "isurface_host.hpp"
#include "signal.hpp"
#include "surface_registry.hpp"

enum class OverlayKind { SplitMenu, TabContextMenu, StylePicker, SurfaceUrlPopover };
std::string to_string(OverlayKind k);

enum class CaptureState { Visible, Capturing, Hidden };

struct SurfaceSnapshot {
  bool captured = false; // false: capture failed, show the URL placeholder
  SurfaceImage image;
  std::string url;
};

class OcclusionCoordinator {
public:
  enum class ModalPhase { Closed, Capturing, Open };

  OcclusionCoordinator(SurfaceRegistry& registry, Signal<>& refresh);

  // Surfaces are hidden (calls issued) before this returns.
  void open_overlay(OverlayKind kind);
  void close_overlay(OverlayKind kind);
  bool overlay_open(OverlayKind kind) const;
  int open_overlay_count() const;
  // Some overlay or dialog needs surfaces hidden; refresh must not show them.
  bool covering() const;

  // Starts capture-then-hide; `on_open` runs once every surface is hidden
  // (synchronously when nothing needs hiding). false if a modal is active.
  bool begin_modal(std::function<void()> on_open);
  // Dialog dismissed before it opened: late captures are discarded.
  void cancel_modal();
  void end_modal();
  ModalPhase modal_phase() const { return phase_; }
  bool modal_open() const { return phase_ == ModalPhase::Open; }

  CaptureState state_of(const std::string& pane_id) const;
  const SurfaceSnapshot* snapshot_for(const std::string& pane_id) const;

private:
  struct Tracked {
    CaptureState state = CaptureState::Visible;
    bool hide_issued = false;
  };
  void on_captured(unsigned gen, const std::string& pane_id, const CaptureResult& r);
  void issue_hide(unsigned gen, const std::string& pane_id);
  void check_open(unsigned gen);
  void restore_tracked();

  SurfaceRegistry& registry_;
  Signal<>& refresh_;
  std::map<OverlayKind, int> overlays_;
  ModalPhase phase_ = ModalPhase::Closed;
  unsigned generation_ = 0;
  std::map<std::string, Tracked> tracked_;
  std::map<std::string, SurfaceSnapshot> snapshots_;
  std::function<void()> on_open_;
};
