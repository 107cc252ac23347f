#pragma once
/*
 * SurfaceRegistry
 *
 * Purpose: sole owner of the pane id → native surface mapping.
 * Each surface is a small actor: requests are queued per surface and only one
 * host call per surface is in flight, so the host always observes
 * create → bounds... → destroy in request order. pump() (UI loop) collects
 * finished host futures and starts the next queued call.
 * Invariants:
 *   - exactly one destroy per surface; later destroy requests are no-ops
 *   - a destroy requested while create is pending runs right after it resolves
 *   - queued, not yet issued bounds updates are merged (latest rect wins)
 *   - the most recent kRetiredLimit destroyed pane ids cannot be created again
 */
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "isurface_host.hpp"
#include "signal.hpp"
#include "types.hpp"

enum class SurfaceState { Pending, Created, Failed, Destroyed };
std::string to_string(SurfaceState s);

struct SurfaceEntry {
  std::string pane_id;
  std::string surface_id;
  std::string url;
  Rect bounds;         // last desired on-screen rect
  bool visible = true; // false: parked off-screen
  SurfaceState state = SurfaceState::Pending;
  std::string error;   // last create failure
  bool destroy_requested = false;
};

class SurfaceRegistry {
public:
  using Done = std::function<void(const HostStatus&)>;
  using CaptureDone = std::function<void(const CaptureResult&)>;

  explicit SurfaceRegistry(ISurfaceHost& host);
  SurfaceRegistry(const SurfaceRegistry&) = delete;
  SurfaceRegistry& operator=(const SurfaceRegistry&) = delete;

  static std::string surface_id_for(const std::string& pane_id) { return "surface-" + pane_id; }

  // false when the pane already had a surface (live or destroyed).
  bool create(const std::string& pane_id, const std::string& url, const Rect& rect, bool visible = true, Done done = {});
  // Records the desired rect; it reaches the host only while visible.
  bool update_bounds(const std::string& pane_id, const Rect& rect, Done done = {});
  bool show(const std::string& pane_id, Done done = {});
  // update_bounds + show in one host call.
  bool place(const std::string& pane_id, const Rect& rect, Done done = {});
  bool hide(const std::string& pane_id, Done done = {});
  bool navigate(const std::string& pane_id, const std::string& url, Done done = {});
  bool capture(const std::string& pane_id, CaptureDone done);
  // Idempotent: true only for the call that actually schedules the destroy.
  bool destroy(const std::string& pane_id);
  bool retry(const std::string& pane_id);
  void hide_all();
  void destroy_all();

  // Returns the number of host calls completed.
  int pump();

  const SurfaceEntry* find(const std::string& pane_id) const;
  std::vector<std::string> pane_ids() const;
  size_t size() const { return slots_.size(); }
  size_t retired_count() const { return retired_.size(); }

  static constexpr size_t kRetiredLimit = 1024;
  bool idle() const;

  Signal<const std::string&, SurfaceState> state_changed;

private:
  struct Op {
    enum class Kind { Create, Bounds, Navigate, Capture, Destroy };
    Kind kind = Kind::Bounds;
    std::string url;
    Rect rect;
    Done done;
    CaptureDone capture_done;
  };
  struct InFlight {
    Op op;
    std::future<HostStatus> status;
    std::future<CaptureResult> capture;
  };
  struct Slot {
    SurfaceEntry entry;
    std::deque<Op> queue;
    std::optional<InFlight> in_flight;
  };

  Slot* slot_for(const std::string& pane_id);
  Slot* live_slot(const std::string& pane_id);
  void enqueue(Slot& slot, Op op);
  void start_next(Slot& slot);
  // true when the slot has been retired and erased
  bool complete(const std::string& pane_id);
  void drop_queued(Slot& slot, const std::string& reason);
  void set_state(Slot& slot, SurfaceState s);
  void retire(const std::string& pane_id);

  ISurfaceHost& host_;
  std::map<std::string, Slot> slots_;
  std::unordered_set<std::string> retired_;
  std::deque<std::string> retired_order_;
};
