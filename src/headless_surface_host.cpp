#include "headless_surface_host.hpp"
#include <algorithm>
#include <memory>

std::string to_string(HostCall::Op op) {
  switch (op) {
    case HostCall::Op::Create: return "create";
    case HostCall::Op::UpdateBounds: return "update_bounds";
    case HostCall::Op::Destroy: return "destroy";
    case HostCall::Op::Navigate: return "navigate";
    case HostCall::Op::Capture: return "capture";
  }
  return "unknown";
}

static bool take_failure(std::vector<std::pair<std::string, std::string>>& list, const std::string& id, std::string& error) {
  auto it = std::find_if(list.begin(), list.end(), [&](const auto& f) { return f.first == id; });
  if (it == list.end()) return false;
  error = it->second;
  list.erase(it);
  return true;
}

HostStatus HeadlessSurfaceHost::apply(const HostCall& call) {
  auto it = std::find_if(live_.begin(), live_.end(), [&](const auto& s) { return s.first == call.id; });
  switch (call.op) {
    case HostCall::Op::Create: {
      std::string err;
      if (take_failure(create_failures_, call.id, err)) return HostStatus::failure(err);
      if (it != live_.end()) it->second = call.rect; // host replaces a surface with the same id
      else live_.emplace_back(call.id, call.rect);
      return HostStatus::success();
    }
    case HostCall::Op::UpdateBounds:
      if (it == live_.end()) return HostStatus::failure("no such surface: " + call.id);
      it->second = call.rect;
      return HostStatus::success();
    case HostCall::Op::Destroy:
      if (it == live_.end()) return HostStatus::failure("no such surface: " + call.id);
      live_.erase(it);
      return HostStatus::success();
    case HostCall::Op::Navigate:
    case HostCall::Op::Capture:
      if (it == live_.end()) return HostStatus::failure("no such surface: " + call.id);
      return HostStatus::success();
  }
  return HostStatus::success();
}

std::future<HostStatus> HeadlessSurfaceHost::enqueue_status(HostCall call) {
  calls_.push_back(call);
  auto p = std::make_shared<std::promise<HostStatus>>();
  auto fut = p->get_future();
  pending_.push_back(Pending{call, [this, call, p] { p->set_value(apply(call)); }});
  if (auto_resolve_) resolve_all();
  return fut;
}

std::future<HostStatus> HeadlessSurfaceHost::create_surface(const std::string& id, const std::string& url, const Rect& rect) {
  return enqueue_status(HostCall{HostCall::Op::Create, id, url, rect});
}

std::future<HostStatus> HeadlessSurfaceHost::update_surface_bounds(const std::string& id, const Rect& rect) {
  return enqueue_status(HostCall{HostCall::Op::UpdateBounds, id, std::string(), rect});
}

std::future<HostStatus> HeadlessSurfaceHost::destroy_surface(const std::string& id) {
  return enqueue_status(HostCall{HostCall::Op::Destroy, id, std::string(), Rect{}});
}

std::future<HostStatus> HeadlessSurfaceHost::navigate_surface(const std::string& id, const std::string& url) {
  return enqueue_status(HostCall{HostCall::Op::Navigate, id, url, Rect{}});
}

std::future<CaptureResult> HeadlessSurfaceHost::capture_surface(const std::string& id) {
  HostCall call{HostCall::Op::Capture, id, std::string(), Rect{}};
  calls_.push_back(call);
  auto p = std::make_shared<std::promise<CaptureResult>>();
  auto fut = p->get_future();
  pending_.push_back(Pending{call, [this, call, p] {
    CaptureResult r;
    std::string err;
    if (take_failure(capture_failures_, call.id, err)) r.status = HostStatus::failure(err);
    else r.status = apply(call);
    if (r.status.ok) {
      Rect b = bounds(call.id);
      r.image.width = b.width;
      r.image.height = b.height;
      r.image.rows.push_back("capture of " + call.id);
    }
    p->set_value(std::move(r));
  }});
  if (auto_resolve_) resolve_all();
  return fut;
}

void HeadlessSurfaceHost::fail_next_create(const std::string& id, std::string error) {
  create_failures_.emplace_back(id, std::move(error));
}

void HeadlessSurfaceHost::fail_next_capture(const std::string& id, std::string error) {
  capture_failures_.emplace_back(id, std::move(error));
}

bool HeadlessSurfaceHost::resolve_next() {
  if (pending_.empty()) return false;
  Pending p = std::move(pending_.front());
  pending_.pop_front();
  p.resolve();
  return true;
}

int HeadlessSurfaceHost::resolve_all() {
  int n = 0;
  while (resolve_next()) n++;
  return n;
}

std::vector<HostCall> HeadlessSurfaceHost::calls_for(const std::string& id) const {
  std::vector<HostCall> out;
  for (const auto& c : calls_) if (c.id == id) out.push_back(c);
  return out;
}

int HeadlessSurfaceHost::count(HostCall::Op op, const std::string& id) const {
  return static_cast<int>(std::count_if(calls_.begin(), calls_.end(), [&](const HostCall& c) { return c.op == op && c.id == id; }));
}

bool HeadlessSurfaceHost::alive(const std::string& id) const {
  return std::any_of(live_.begin(), live_.end(), [&](const auto& s) { return s.first == id; });
}

Rect HeadlessSurfaceHost::bounds(const std::string& id) const {
  for (const auto& s : live_) if (s.first == id) return s.second;
  return Rect{};
}
