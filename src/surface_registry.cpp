#include "surface_registry.hpp"
#include <chrono>
#include "log.hpp"

std::string to_string(SurfaceState s) {
  switch (s) {
    case SurfaceState::Pending: return "pending";
    case SurfaceState::Created: return "created";
    case SurfaceState::Failed: return "failed";
    case SurfaceState::Destroyed: return "destroyed";
  }
  return "unknown";
}

template <typename T>
static bool is_ready(const std::future<T>& f) {
  return f.valid() && f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

SurfaceRegistry::SurfaceRegistry(ISurfaceHost& host) : host_(host) {}

SurfaceRegistry::Slot* SurfaceRegistry::slot_for(const std::string& pane_id) {
  auto it = slots_.find(pane_id);
  return it == slots_.end() ? nullptr : &it->second;
}

SurfaceRegistry::Slot* SurfaceRegistry::live_slot(const std::string& pane_id) {
  Slot* s = slot_for(pane_id);
  if (!s || s->entry.destroy_requested) return nullptr;
  return s;
}

const SurfaceEntry* SurfaceRegistry::find(const std::string& pane_id) const {
  auto it = slots_.find(pane_id);
  return it == slots_.end() ? nullptr : &it->second.entry;
}

std::vector<std::string> SurfaceRegistry::pane_ids() const {
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (const auto& [id, slot] : slots_) out.push_back(id);
  return out;
}

bool SurfaceRegistry::idle() const {
  for (const auto& [id, slot] : slots_) {
    if (slot.in_flight || !slot.queue.empty()) return false;
  }
  return true;
}

void SurfaceRegistry::set_state(Slot& slot, SurfaceState s) {
  if (slot.entry.state == s) return;
  slot.entry.state = s;
  state_changed.emit(slot.entry.pane_id, s);
}

void SurfaceRegistry::retire(const std::string& pane_id) {
  if (!retired_.insert(pane_id).second) return;
  retired_order_.push_back(pane_id);
  if (retired_order_.size() > kRetiredLimit) {
    retired_.erase(retired_order_.front());
    retired_order_.pop_front();
  }
}

bool SurfaceRegistry::create(const std::string& pane_id, const std::string& url, const Rect& rect, bool visible, Done done) {
  if (slots_.count(pane_id) || retired_.count(pane_id)) return false;
  Slot& slot = slots_[pane_id];
  slot.entry.pane_id = pane_id;
  slot.entry.surface_id = surface_id_for(pane_id);
  slot.entry.url = url;
  slot.entry.bounds = rect;
  slot.entry.visible = visible;
  slot.entry.state = SurfaceState::Pending;
  Op op;
  op.kind = Op::Kind::Create;
  op.url = url;
  op.rect = visible ? rect : offscreen_rect(rect);
  op.done = std::move(done);
  enqueue(slot, std::move(op));
  state_changed.emit(pane_id, SurfaceState::Pending);
  return true;
}

bool SurfaceRegistry::update_bounds(const std::string& pane_id, const Rect& rect, Done done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  slot->entry.bounds = rect;
  if (!slot->entry.visible || slot->entry.state == SurfaceState::Failed) {
    if (done) done(HostStatus::success());
    return true;
  }
  Op op;
  op.kind = Op::Kind::Bounds;
  op.rect = rect;
  op.done = std::move(done);
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::show(const std::string& pane_id, Done done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  slot->entry.visible = true;
  if (slot->entry.state == SurfaceState::Failed) {
    if (done) done(HostStatus::success());
    return true;
  }
  Op op;
  op.kind = Op::Kind::Bounds;
  op.rect = slot->entry.bounds;
  op.done = std::move(done);
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::place(const std::string& pane_id, const Rect& rect, Done done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  slot->entry.bounds = rect;
  return show(pane_id, std::move(done));
}

bool SurfaceRegistry::hide(const std::string& pane_id, Done done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  slot->entry.visible = false;
  if (slot->entry.state == SurfaceState::Failed) {
    if (done) done(HostStatus::success());
    return true;
  }
  Op op;
  op.kind = Op::Kind::Bounds;
  op.rect = offscreen_rect(slot->entry.bounds);
  op.done = std::move(done);
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::navigate(const std::string& pane_id, const std::string& url, Done done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  slot->entry.url = url;
  if (slot->entry.state == SurfaceState::Failed) {
    // picked up by the next retry
    if (done) done(HostStatus::success());
    return true;
  }
  Op op;
  op.kind = Op::Kind::Navigate;
  op.url = url;
  op.done = std::move(done);
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::capture(const std::string& pane_id, CaptureDone done) {
  Slot* slot = live_slot(pane_id);
  if (!slot) return false;
  if (slot->entry.state == SurfaceState::Failed) {
    CaptureResult r;
    r.status = HostStatus::failure("surface not created: " + pane_id);
    if (done) done(r);
    return true;
  }
  Op op;
  op.kind = Op::Kind::Capture;
  op.capture_done = std::move(done);
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::destroy(const std::string& pane_id) {
  Slot* slot = slot_for(pane_id);
  if (!slot || slot->entry.destroy_requested) return false;
  slot->entry.destroy_requested = true;
  drop_queued(*slot, "surface destroyed: " + pane_id);
  Op op;
  op.kind = Op::Kind::Destroy;
  enqueue(*slot, std::move(op));
  return true;
}

bool SurfaceRegistry::retry(const std::string& pane_id) {
  Slot* slot = live_slot(pane_id);
  if (!slot || slot->entry.state != SurfaceState::Failed || slot->in_flight) return false;
  slot->entry.error.clear();
  set_state(*slot, SurfaceState::Pending);
  Op op;
  op.kind = Op::Kind::Create;
  op.url = slot->entry.url;
  op.rect = slot->entry.visible ? slot->entry.bounds : offscreen_rect(slot->entry.bounds);
  enqueue(*slot, std::move(op));
  return true;
}

void SurfaceRegistry::hide_all() {
  for (const auto& id : pane_ids()) hide(id);
}

void SurfaceRegistry::destroy_all() {
  for (const auto& id : pane_ids()) destroy(id);
}

void SurfaceRegistry::drop_queued(Slot& slot, const std::string& reason) {
  std::deque<Op> dropped;
  dropped.swap(slot.queue);
  for (auto& op : dropped) {
    if (op.done) op.done(HostStatus::failure(reason));
    if (op.capture_done) {
      CaptureResult r;
      r.status = HostStatus::failure(reason);
      op.capture_done(r);
    }
  }
}

void SurfaceRegistry::enqueue(Slot& slot, Op op) {
  if (op.kind == Op::Kind::Bounds && !slot.queue.empty() && slot.queue.back().kind == Op::Kind::Bounds) {
    Op& last = slot.queue.back();
    last.rect = op.rect;
    if (op.done) {
      Done prev = std::move(last.done);
      Done next = std::move(op.done);
      last.done = [prev = std::move(prev), next = std::move(next)](const HostStatus& s) {
        if (prev) prev(s);
        next(s);
      };
    }
    return;
  }
  slot.queue.push_back(std::move(op));
  start_next(slot);
}

void SurfaceRegistry::start_next(Slot& slot) {
  if (slot.in_flight || slot.queue.empty()) return;
  InFlight f;
  f.op = std::move(slot.queue.front());
  slot.queue.pop_front();
  const std::string& sid = slot.entry.surface_id;
  switch (f.op.kind) {
    case Op::Kind::Create: f.status = host_.create_surface(sid, f.op.url, f.op.rect); break;
    case Op::Kind::Bounds: f.status = host_.update_surface_bounds(sid, f.op.rect); break;
    case Op::Kind::Navigate: f.status = host_.navigate_surface(sid, f.op.url); break;
    case Op::Kind::Capture: f.capture = host_.capture_surface(sid); break;
    case Op::Kind::Destroy:
      // nothing lives on the host after a failed create
      if (slot.entry.state == SurfaceState::Failed) f.status = ready_future(HostStatus::success());
      else f.status = host_.destroy_surface(sid);
      break;
  }
  slot.in_flight = std::move(f);
}

bool SurfaceRegistry::complete(const std::string& pane_id) {
  Slot* slot = slot_for(pane_id);
  InFlight f = std::move(*slot->in_flight);
  slot->in_flight.reset();

  if (f.op.kind == Op::Kind::Capture) {
    CaptureResult r = f.capture.get();
    if (!r.status.ok) log_warn("registry", "capture failed for " + pane_id + ": " + r.status.error);
    if (f.op.capture_done) f.op.capture_done(r);
    start_next(*slot);
    return false;
  }

  HostStatus st = f.status.get();
  switch (f.op.kind) {
    case Op::Kind::Create:
      if (st.ok) {
        set_state(*slot, SurfaceState::Created);
      } else {
        slot->entry.error = st.error;
        log_error("registry", "create failed for " + pane_id + ": " + st.error);
        set_state(*slot, SurfaceState::Failed);
        // keep a queued destroy; everything else targets a surface that does not exist
        std::deque<Op> keep;
        std::deque<Op> rest;
        rest.swap(slot->queue);
        for (auto& op : rest) if (op.kind == Op::Kind::Destroy) keep.push_back(std::move(op));
        slot->queue = std::move(keep);
        for (auto& op : rest) {
          if (op.kind == Op::Kind::Destroy) continue;
          if (op.done) op.done(HostStatus::failure(st.error));
          if (op.capture_done) { CaptureResult r; r.status = HostStatus::failure(st.error); op.capture_done(r); }
        }
      }
      break;
    case Op::Kind::Bounds:
      if (!st.ok) log_warn("registry", "bounds update failed for " + pane_id + ": " + st.error);
      break;
    case Op::Kind::Navigate:
      if (!st.ok) log_warn("registry", "navigate failed for " + pane_id + ": " + st.error);
      break;
    case Op::Kind::Destroy: {
      if (!st.ok) log_warn("registry", "destroy failed for " + pane_id + ": " + st.error);
      drop_queued(*slot, "surface destroyed: " + pane_id);
      slot->entry.state = SurfaceState::Destroyed;
      slots_.erase(pane_id);
      retire(pane_id);
      state_changed.emit(pane_id, SurfaceState::Destroyed);
      return true;
    }
    case Op::Kind::Capture:
      break;
  }
  if (f.op.done) f.op.done(st);
  // the callback may have scheduled more work; the slot is still ours
  if (Slot* again = slot_for(pane_id)) start_next(*again);
  return false;
}

int SurfaceRegistry::pump() {
  int completed = 0;
  bool progress = true;
  while (progress) {
    progress = false;
    for (const auto& id : pane_ids()) {
      Slot* slot = slot_for(id);
      if (!slot || !slot->in_flight) continue;
      const InFlight& f = *slot->in_flight;
      bool ready = f.op.kind == Op::Kind::Capture ? is_ready(f.capture) : is_ready(f.status);
      if (!ready) continue;
      complete(id);
      completed++;
      progress = true;
    }
  }
  return completed;
}
