#pragma once
/*
 * ISurfaceHost
 *
 * Purpose: abstract host of native surfaces (create, bounds, destroy, navigate,
 * capture). Every call returns immediately with a future; the host resolves it
 * whenever the windowing layer is done.
 * Goal: decouple the registry from a concrete host (ncurses/headless), enable testing.
 */
#include <future>
#include <string>
#include <vector>
#include "types.hpp"

struct HostStatus {
  bool ok = true;
  std::string error;
  static HostStatus success() { return {}; }
  static HostStatus failure(std::string e) { return {false, std::move(e)}; }
};

// Frozen picture of a surface: one string per cell row.
struct SurfaceImage {
  int width = 0;
  int height = 0;
  std::vector<std::string> rows;
};

struct CaptureResult {
  HostStatus status;
  SurfaceImage image;
};

class ISurfaceHost {
public:
  virtual ~ISurfaceHost() = default;
  virtual std::future<HostStatus> create_surface(const std::string& id, const std::string& url, const Rect& rect) = 0;
  virtual std::future<HostStatus> update_surface_bounds(const std::string& id, const Rect& rect) = 0;
  virtual std::future<HostStatus> destroy_surface(const std::string& id) = 0;
  virtual std::future<HostStatus> navigate_surface(const std::string& id, const std::string& url) = 0;
  virtual std::future<CaptureResult> capture_surface(const std::string& id) = 0;

  // UI-loop hooks: resolve finished calls, then draw surfaces over the staged frame.
  virtual int pump() { return 0; }
  virtual void composite() {}
};

template <typename T>
std::future<T> ready_future(T value) {
  std::promise<T> p;
  p.set_value(std::move(value));
  return p.get_future();
}
