#pragma once
/*
 * BoundsSynchronizer
 *
 * Purpose: keep one web-surface pane's native surface aligned with the pane's
 * on-screen rectangle. One instance per mounted surface pane; destroying the
 * instance (unmount) destroys the surface through the registry.
 * Flow: observe(rect) on every geometry change → create once the container has
 * area (retrying after a delay while it has none) → bounds updates afterwards.
 * The refresh signal re-applies the last rectangle and makes the surface
 * visible again (used after overlays close).
 */
#include <chrono>
#include <functional>
#include <string>
#include "signal.hpp"
#include "surface_registry.hpp"
#include "types.hpp"

class BoundsSynchronizer {
public:
  using Clock = std::chrono::steady_clock;

  struct Timing {
    Clock::duration initial_delay = std::chrono::milliseconds(100);
    Clock::duration retry_delay = std::chrono::milliseconds(200);
  };

  BoundsSynchronizer(SurfaceRegistry& registry, Signal<>& refresh_signal, std::string pane_id, std::string url,
                     Timing timing, Clock::time_point now);
  ~BoundsSynchronizer();
  BoundsSynchronizer(const BoundsSynchronizer&) = delete;
  BoundsSynchronizer& operator=(const BoundsSynchronizer&) = delete;

  // Geometry observer: called with the pane's absolute rect after every layout.
  void observe(const Rect& rect, Clock::time_point now);
  // Pane shown/hidden (tab switches). Hidden surfaces stay alive off-screen.
  void set_visible(bool visible);
  // Runs the delayed create when due.
  void tick(Clock::time_point now);
  // Re-applies the last rect and shows the surface, unless held.
  void refresh();
  // While held() returns true, refresh requests are ignored.
  void set_hold(std::function<bool()> held) { held_ = std::move(held); }
  // Explicit teardown; also run by the destructor. Idempotent.
  void unmount();

  const std::string& pane_id() const { return pane_id_; }
  bool create_requested() const { return create_requested_; }
  bool waiting_for_area() const { return waiting_; }
  bool visible() const { return visible_; }
  const Rect& last_rect() const { return rect_; }

private:
  void try_create(Clock::time_point now);

  SurfaceRegistry& registry_;
  Signal<>& refresh_;
  int refresh_conn_ = 0;
  std::function<bool()> held_;
  std::string pane_id_;
  std::string url_;
  Timing timing_;
  Rect rect_;
  bool have_rect_ = false;
  bool visible_ = true;
  bool create_requested_ = false;
  bool waiting_ = true;
  bool mounted_ = true;
  Clock::time_point create_at_;
};
