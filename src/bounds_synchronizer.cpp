#include "bounds_synchronizer.hpp"
#include "log.hpp"

BoundsSynchronizer::BoundsSynchronizer(SurfaceRegistry& registry, Signal<>& refresh_signal, std::string pane_id,
                                       std::string url, Timing timing, Clock::time_point now)
    : registry_(registry), refresh_(refresh_signal), pane_id_(std::move(pane_id)), url_(std::move(url)), timing_(timing) {
  create_at_ = now + timing_.initial_delay;
  refresh_conn_ = refresh_.connect([this] { this->refresh(); });
}

BoundsSynchronizer::~BoundsSynchronizer() { unmount(); }

void BoundsSynchronizer::unmount() {
  if (!mounted_) return;
  mounted_ = false;
  refresh_.disconnect(refresh_conn_);
  // registry ignores a pane that was already destroyed by the close path
  if (create_requested_) registry_.destroy(pane_id_);
}

void BoundsSynchronizer::observe(const Rect& rect, Clock::time_point now) {
  if (!mounted_) return;
  bool changed = !have_rect_ || !(rect == rect_);
  rect_ = rect;
  have_rect_ = true;
  if (!create_requested_) {
    if (now >= create_at_) try_create(now);
    return;
  }
  if (changed) registry_.update_bounds(pane_id_, rect_);
}

void BoundsSynchronizer::tick(Clock::time_point now) {
  if (!mounted_ || create_requested_ || !have_rect_) return;
  if (now >= create_at_) try_create(now);
}

void BoundsSynchronizer::try_create(Clock::time_point now) {
  if (rect_.empty()) {
    log_warn("sync", "surface container for " + pane_id_ + " has zero area, retrying");
    waiting_ = true;
    create_at_ = now + timing_.retry_delay;
    return;
  }
  waiting_ = false;
  create_requested_ = true;
  if (!registry_.create(pane_id_, url_, rect_, visible_)) {
    log_warn("sync", "surface for " + pane_id_ + " already registered");
    return;
  }
  log_info("sync", "creating surface for " + pane_id_ + " at " + url_);
}

void BoundsSynchronizer::set_visible(bool visible) {
  if (!mounted_ || visible_ == visible) return;
  visible_ = visible;
  if (!create_requested_) return;
  if (visible_) registry_.show(pane_id_);
  else registry_.hide(pane_id_);
}

void BoundsSynchronizer::refresh() {
  if (!mounted_ || !create_requested_ || !visible_) return;
  if (held_ && held_()) return; // an overlay or dialog still needs the surface out of the way
  if (have_rect_) registry_.place(pane_id_, rect_);
  else registry_.show(pane_id_);
}
