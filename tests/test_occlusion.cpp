#include "headless_surface_host.hpp"
#include "occlusion_coordinator.hpp"
#include <cassert>
#include <string>
#include <vector>

static const Rect kRect{1, 0, 10, 40};

static void drain(HeadlessSurfaceHost& host, SurfaceRegistry& reg) {
  while (host.resolve_all() > 0) reg.pump();
  reg.pump();
}

static void make_surfaces(HeadlessSurfaceHost& host, SurfaceRegistry& reg, const std::vector<std::string>& panes) {
  for (const auto& p : panes) reg.create(p, "https://" + p + ".example", kRect);
  drain(host, reg);
  host.clear_calls();
}

static void test_overlays_hide_everything() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  int refreshes = 0;
  refresh.connect([&] { refreshes++; });
  OcclusionCoordinator occ(reg, refresh);
  make_surfaces(host, reg, {"a", "b"});

  occ.open_overlay(OverlayKind::SplitMenu);
  // hide calls are issued before the overlay is considered open
  assert(host.count(HostCall::Op::UpdateBounds, SurfaceRegistry::surface_id_for("a")) == 1);
  assert(host.count(HostCall::Op::UpdateBounds, SurfaceRegistry::surface_id_for("b")) == 1);
  occ.open_overlay(OverlayKind::SurfaceUrlPopover);
  assert(occ.open_overlay_count() == 2);
  drain(host, reg);
  assert(is_offscreen(host.bounds(SurfaceRegistry::surface_id_for("a"))));

  occ.close_overlay(OverlayKind::SplitMenu);
  assert(refreshes == 0);
  occ.close_overlay(OverlayKind::SplitMenu); // not open: ignored
  assert(refreshes == 0);
  occ.close_overlay(OverlayKind::SurfaceUrlPopover);
  assert(refreshes == 1);
  assert(!occ.overlay_open(OverlayKind::SurfaceUrlPopover));
}

static void test_modal_capture_then_hide() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  int refreshes = 0;
  refresh.connect([&] { refreshes++; });
  OcclusionCoordinator occ(reg, refresh);
  make_surfaces(host, reg, {"a", "b"});
  const std::string sa = SurfaceRegistry::surface_id_for("a");

  int opened = 0;
  assert(occ.begin_modal([&] { opened++; }));
  assert(!occ.begin_modal([] {}));
  assert(occ.modal_phase() == OcclusionCoordinator::ModalPhase::Capturing);
  assert(occ.state_of("a") == CaptureState::Capturing);
  assert(host.count(HostCall::Op::UpdateBounds, sa) == 0);

  // first capture lands: image is kept, then that surface is moved away
  host.resolve_next();
  reg.pump();
  assert(occ.snapshot_for("a") != nullptr);
  assert(occ.snapshot_for("a")->captured);
  assert(occ.snapshot_for("a")->image.rows.front() == "capture of " + sa);
  assert(host.calls().back().op == HostCall::Op::UpdateBounds);
  assert(opened == 0);

  drain(host, reg);
  assert(opened == 1);
  assert(occ.modal_open());
  assert(occ.state_of("a") == CaptureState::Hidden);
  assert(occ.state_of("b") == CaptureState::Hidden);
  assert(is_offscreen(host.bounds(sa)));
  auto calls = host.calls_for(sa);
  assert(calls.size() == 2);
  assert(calls[0].op == HostCall::Op::Capture);
  assert(calls[1].op == HostCall::Op::UpdateBounds);

  // closing: surfaces go back first, images are dropped after
  assert(occ.covering());
  assert(refreshes == 0);
  occ.end_modal();
  assert(occ.modal_phase() == OcclusionCoordinator::ModalPhase::Closed);
  assert(!occ.covering());
  assert(refreshes == 1);
  assert(occ.snapshot_for("a") != nullptr);
  drain(host, reg);
  assert(occ.snapshot_for("a") == nullptr);
  assert(occ.snapshot_for("b") == nullptr);
  assert(host.bounds(sa) == kRect);
}

static void test_capture_failure_uses_placeholder() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  OcclusionCoordinator occ(reg, refresh);
  make_surfaces(host, reg, {"a"});
  const std::string sa = SurfaceRegistry::surface_id_for("a");
  host.fail_next_capture(sa, "no compositor");

  bool opened = false;
  occ.begin_modal([&] { opened = true; });
  drain(host, reg);
  assert(opened);
  const SurfaceSnapshot* snap = occ.snapshot_for("a");
  assert(snap && !snap->captured);
  assert(snap->url == "https://a.example");
  assert(is_offscreen(host.bounds(sa)));
}

static void test_cancel_discards_late_captures() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  OcclusionCoordinator occ(reg, refresh);
  make_surfaces(host, reg, {"a"});
  const std::string sa = SurfaceRegistry::surface_id_for("a");

  bool opened = false;
  occ.begin_modal([&] { opened = true; });
  occ.cancel_modal();
  drain(host, reg);
  assert(!opened);
  assert(occ.snapshot_for("a") == nullptr);
  assert(host.count(HostCall::Op::UpdateBounds, sa) == 0);
  assert(host.bounds(sa) == kRect);

  // a fresh modal after the cancelled one works normally
  occ.begin_modal([&] { opened = true; });
  drain(host, reg);
  assert(opened);
}

static void test_modal_without_surfaces_opens_at_once() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  OcclusionCoordinator occ(reg, refresh);
  bool opened = false;
  occ.begin_modal([&] { opened = true; });
  assert(opened);
  assert(occ.modal_open());
  occ.end_modal();
  assert(!occ.modal_open());
}

static void test_pending_create_is_parked() {
  HeadlessSurfaceHost host;
  SurfaceRegistry reg(host);
  Signal<> refresh;
  OcclusionCoordinator occ(reg, refresh);
  reg.create("a", "https://a.example", kRect);
  bool opened = false;
  occ.begin_modal([&] { opened = true; });
  assert(occ.snapshot_for("a") && !occ.snapshot_for("a")->captured);
  drain(host, reg);
  assert(opened);
  assert(host.count(HostCall::Op::Capture, SurfaceRegistry::surface_id_for("a")) == 0);
}

int main() {
  test_overlays_hide_everything();
  test_modal_capture_then_hide();
  test_capture_failure_uses_placeholder();
  test_cancel_discards_late_captures();
  test_modal_without_surfaces_opens_at_once();
  test_pending_create_is_parked();
  return 0;
}
