#pragma once
/*
 * HeadlessSurfaceHost
 *
 * Purpose: ISurfaceHost without a window system, for automated tests.
 * Records every call in arrival order and keeps its future pending until the
 * test resolves it (or resolves immediately in auto-resolve mode).
 */
#include <deque>
#include <functional>
#include <string>
#include <vector>
#include "isurface_host.hpp"

struct HostCall {
  enum class Op { Create, UpdateBounds, Destroy, Navigate, Capture };
  Op op;
  std::string id;
  std::string url;
  Rect rect;
};

std::string to_string(HostCall::Op op);

class HeadlessSurfaceHost : public ISurfaceHost {
public:
  std::future<HostStatus> create_surface(const std::string& id, const std::string& url, const Rect& rect) override;
  std::future<HostStatus> update_surface_bounds(const std::string& id, const Rect& rect) override;
  std::future<HostStatus> destroy_surface(const std::string& id) override;
  std::future<HostStatus> navigate_surface(const std::string& id, const std::string& url) override;
  std::future<CaptureResult> capture_surface(const std::string& id) override;

  void set_auto_resolve(bool on) { auto_resolve_ = on; }
  // Next create/capture for `id` fails with `error` when resolved.
  void fail_next_create(const std::string& id, std::string error);
  void fail_next_capture(const std::string& id, std::string error);

  // Resolves the oldest pending call; false when nothing is pending.
  bool resolve_next();
  int resolve_all();
  size_t pending() const { return pending_.size(); }

  const std::vector<HostCall>& calls() const { return calls_; }
  std::vector<HostCall> calls_for(const std::string& id) const;
  int count(HostCall::Op op, const std::string& id) const;
  void clear_calls() { calls_.clear(); }
  // Currently created surfaces and their last bounds.
  bool alive(const std::string& id) const;
  Rect bounds(const std::string& id) const;

private:
  struct Pending {
    HostCall call;
    std::function<void()> resolve;
  };
  std::future<HostStatus> enqueue_status(HostCall call);
  HostStatus apply(const HostCall& call);

  std::vector<HostCall> calls_;
  std::deque<Pending> pending_;
  std::vector<std::pair<std::string, Rect>> live_;
  std::vector<std::pair<std::string, std::string>> create_failures_;
  std::vector<std::pair<std::string, std::string>> capture_failures_;
  bool auto_resolve_ = false;
};
