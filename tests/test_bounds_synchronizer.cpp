#include "bounds_synchronizer.hpp"
#include "headless_surface_host.hpp"
#include <cassert>
#include <chrono>
#include <memory>

using namespace std::chrono_literals;
using Clock = BoundsSynchronizer::Clock;

static const Rect kRect{2, 0, 10, 40};

static void test_create_after_initial_delay() {
  HeadlessSurfaceHost host;
  host.set_auto_resolve(true);
  SurfaceRegistry reg(host);
  Signal<> refresh;
  Clock::time_point t0{};
  BoundsSynchronizer sync(reg, refresh, "w1", "https://example.com", BoundsSynchronizer::Timing{}, t0);
  const std::string sid = SurfaceRegistry::surface_id_for("w1");

  sync.observe(kRect, t0);
  assert(!sync.create_requested());
  sync.tick(t0 + 50ms);
  assert(host.calls().empty());
  sync.tick(t0 + 100ms);
  assert(sync.create_requested());
  assert(!sync.waiting_for_area());
  reg.pump();
  assert(host.alive(sid));
  assert(host.bounds(sid) == kRect);

  // later geometry goes out as bounds updates; an unchanged rect is not resent
  Rect moved{2, 20, 10, 20};
  sync.observe(moved, t0 + 200ms);
  sync.observe(moved, t0 + 210ms);
  reg.pump();
  assert(host.count(HostCall::Op::UpdateBounds, sid) == 1);
  assert(host.bounds(sid) == moved);
  assert(host.count(HostCall::Op::Create, sid) == 1);
}

static void test_zero_area_retries() {
  HeadlessSurfaceHost host;
  host.set_auto_resolve(true);
  SurfaceRegistry reg(host);
  Signal<> refresh;
  Clock::time_point t0{};
  BoundsSynchronizer sync(reg, refresh, "w1", "https://example.com", BoundsSynchronizer::Timing{}, t0);

  sync.observe(Rect{2, 0, 0, 40}, t0 + 100ms);
  assert(!sync.create_requested());
  assert(sync.waiting_for_area());
  // area arrives before the retry is due: still waits for the timer
  sync.observe(kRect, t0 + 150ms);
  assert(!sync.create_requested());
  sync.tick(t0 + 299ms);
  assert(!sync.create_requested());
  sync.tick(t0 + 300ms);
  assert(sync.create_requested());
  reg.pump();
  assert(host.count(HostCall::Op::Create, SurfaceRegistry::surface_id_for("w1")) == 1);
}

static void test_visibility_and_refresh() {
  HeadlessSurfaceHost host;
  host.set_auto_resolve(true);
  SurfaceRegistry reg(host);
  Signal<> refresh;
  Clock::time_point t0{};
  BoundsSynchronizer sync(reg, refresh, "w1", "https://example.com", BoundsSynchronizer::Timing{0ms, 200ms}, t0);
  const std::string sid = SurfaceRegistry::surface_id_for("w1");

  // hidden before creation: created off-screen
  sync.set_visible(false);
  sync.observe(kRect, t0);
  reg.pump();
  assert(is_offscreen(host.bounds(sid)));
  refresh.emit();
  reg.pump();
  assert(is_offscreen(host.bounds(sid))); // refresh leaves hidden panes alone

  sync.set_visible(true);
  reg.pump();
  assert(host.bounds(sid) == kRect);

  reg.hide_all();
  reg.pump();
  assert(is_offscreen(host.bounds(sid)));
  refresh.emit();
  reg.pump();
  assert(host.bounds(sid) == kRect);

  // held: refresh requests keep the surface parked until the hold lifts
  bool covered = true;
  sync.set_hold([&covered] { return covered; });
  reg.hide_all();
  refresh.emit();
  reg.pump();
  assert(is_offscreen(host.bounds(sid)));
  covered = false;
  refresh.emit();
  reg.pump();
  assert(host.bounds(sid) == kRect);
}

static void test_unmount_destroys_once() {
  HeadlessSurfaceHost host;
  host.set_auto_resolve(true);
  SurfaceRegistry reg(host);
  Signal<> refresh;
  Clock::time_point t0{};
  const std::string sid = SurfaceRegistry::surface_id_for("w1");
  {
    auto sync = std::make_unique<BoundsSynchronizer>(reg, refresh, "w1", "https://example.com",
                                                     BoundsSynchronizer::Timing{0ms, 200ms}, t0);
    sync->observe(kRect, t0);
    reg.pump();
    assert(refresh.size() == 1);
    sync->unmount();
    sync->unmount();
    assert(refresh.size() == 0);
  }
  reg.pump();
  assert(!host.alive(sid));
  assert(host.count(HostCall::Op::Destroy, sid) == 1);

  // never created: unmount has nothing to tear down
  {
    BoundsSynchronizer idle(reg, refresh, "w2", "https://example.com", BoundsSynchronizer::Timing{}, t0);
  }
  assert(host.calls_for(SurfaceRegistry::surface_id_for("w2")).empty());
}

int main() {
  test_create_after_initial_delay();
  test_zero_area_retries();
  test_visibility_and_refresh();
  test_unmount_destroys_once();
  return 0;
}
