#include "occlusion_coordinator.hpp"
#include "log.hpp"

std::string to_string(OverlayKind k) {
  switch (k) {
    case OverlayKind::SplitMenu: return "split-menu";
    case OverlayKind::TabContextMenu: return "tab-context-menu";
    case OverlayKind::StylePicker: return "style-picker";
    case OverlayKind::SurfaceUrlPopover: return "surface-url-popover";
  }
  return "overlay";
}

OcclusionCoordinator::OcclusionCoordinator(SurfaceRegistry& registry, Signal<>& refresh)
    : registry_(registry), refresh_(refresh) {}

void OcclusionCoordinator::open_overlay(OverlayKind kind) {
  registry_.hide_all();
  overlays_[kind]++;
}

void OcclusionCoordinator::close_overlay(OverlayKind kind) {
  auto it = overlays_.find(kind);
  if (it == overlays_.end()) return;
  if (--it->second <= 0) overlays_.erase(it);
  if (overlays_.empty() && phase_ == ModalPhase::Closed) refresh_.emit();
}

bool OcclusionCoordinator::overlay_open(OverlayKind kind) const {
  return overlays_.count(kind) != 0;
}

bool OcclusionCoordinator::covering() const {
  return !overlays_.empty() || phase_ != ModalPhase::Closed;
}

int OcclusionCoordinator::open_overlay_count() const {
  int n = 0;
  for (const auto& [k, c] : overlays_) n += c;
  return n;
}

CaptureState OcclusionCoordinator::state_of(const std::string& pane_id) const {
  auto it = tracked_.find(pane_id);
  return it == tracked_.end() ? CaptureState::Visible : it->second.state;
}

const SurfaceSnapshot* OcclusionCoordinator::snapshot_for(const std::string& pane_id) const {
  auto it = snapshots_.find(pane_id);
  return it == snapshots_.end() ? nullptr : &it->second;
}

bool OcclusionCoordinator::begin_modal(std::function<void()> on_open) {
  if (phase_ != ModalPhase::Closed) return false;
  unsigned gen = ++generation_;
  phase_ = ModalPhase::Capturing;
  on_open_ = std::move(on_open);
  tracked_.clear();
  snapshots_.clear();

  for (const auto& id : registry_.pane_ids()) {
    const SurfaceEntry* e = registry_.find(id);
    if (!e || e->destroy_requested || !e->visible) continue;
    tracked_[id] = Tracked{};
  }
  for (auto& [id, t] : tracked_) {
    const SurfaceEntry* e = registry_.find(id);
    if (e->state == SurfaceState::Created) {
      t.state = CaptureState::Capturing;
      std::string pane = id;
      registry_.capture(pane, [this, gen, pane](const CaptureResult& r) { on_captured(gen, pane, r); });
    } else {
      // still being created (or failed): nothing to picture, park it directly
      snapshots_[id] = SurfaceSnapshot{false, SurfaceImage{}, e->url};
      issue_hide(gen, id);
    }
  }
  check_open(gen);
  return true;
}

void OcclusionCoordinator::on_captured(unsigned gen, const std::string& pane_id, const CaptureResult& r) {
  if (gen != generation_ || phase_ != ModalPhase::Capturing) return; // dialog gone; discard
  auto it = tracked_.find(pane_id);
  if (it == tracked_.end()) return;
  const SurfaceEntry* e = registry_.find(pane_id);
  SurfaceSnapshot snap;
  snap.url = e ? e->url : std::string();
  if (r.status.ok) {
    snap.captured = true;
    snap.image = r.image;
  } else {
    log_warn("occlusion", "capture failed for " + pane_id + ", hiding with placeholder: " + r.status.error);
  }
  // image first, then move the surface away
  snapshots_[pane_id] = std::move(snap);
  issue_hide(gen, pane_id);
}

void OcclusionCoordinator::issue_hide(unsigned gen, const std::string& pane_id) {
  auto it = tracked_.find(pane_id);
  if (it == tracked_.end()) return;
  it->second.hide_issued = true;
  bool issued = registry_.hide(pane_id, [this, gen, pane_id](const HostStatus& s) {
    if (gen != generation_) return;
    if (!s.ok) log_warn("occlusion", "hiding " + pane_id + " failed: " + s.error);
    auto t = tracked_.find(pane_id);
    if (t != tracked_.end()) t->second.state = CaptureState::Hidden;
    check_open(gen);
  });
  if (!issued) {
    // surface went away meanwhile; nothing left to hide
    it->second.state = CaptureState::Hidden;
    check_open(gen);
  }
}

void OcclusionCoordinator::check_open(unsigned gen) {
  if (gen != generation_ || phase_ != ModalPhase::Capturing) return;
  for (const auto& [id, t] : tracked_) {
    if (t.state != CaptureState::Hidden) return;
  }
  phase_ = ModalPhase::Open;
  auto cb = std::move(on_open_);
  on_open_ = nullptr;
  if (cb) cb();
}

void OcclusionCoordinator::restore_tracked() {
  unsigned gen = generation_;
  auto tracked = std::move(tracked_);
  tracked_.clear();
  bool covered = !overlays_.empty();
  for (const auto& [id, t] : tracked) {
    if (!t.hide_issued) { snapshots_.erase(id); continue; }
    if (covered) { snapshots_.erase(id); continue; } // the overlay refresh brings it back
    std::string pane = id;
    bool issued = registry_.show(pane, [this, gen, pane](const HostStatus&) {
      // surface is back in place; now the frozen image can go
      if (gen == generation_) snapshots_.erase(pane);
    });
    if (!issued) snapshots_.erase(id);
  }
}

void OcclusionCoordinator::cancel_modal() {
  if (phase_ == ModalPhase::Closed) return;
  ++generation_; // late captures and hide acknowledgements are ignored from now on
  phase_ = ModalPhase::Closed;
  on_open_ = nullptr;
  restore_tracked();
}

void OcclusionCoordinator::end_modal() {
  if (phase_ == ModalPhase::Closed) return;
  if (phase_ == ModalPhase::Capturing) { cancel_modal(); return; }
  ++generation_;
  phase_ = ModalPhase::Closed;
  restore_tracked();
  if (overlays_.empty()) refresh_.emit();
}
