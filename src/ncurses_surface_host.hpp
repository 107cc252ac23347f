#pragma once
/*
 * NcursesSurfaceHost
 *
 * Purpose: ISurfaceHost backed by ncurses windows. Each surface is its own
 * WINDOW, drawn after the application's frame so it always covers it, the
 * way an OS-composited view covers the page beneath.
 * Rules:
 *   - calls are queued and resolved by pump() on the UI loop
 *   - bounds at the off-screen origin mean hidden (nothing is drawn)
 *   - capture copies the window's text rows
 */
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <ncurses.h>
#include "isurface_host.hpp"

class NcursesSurfaceHost : public ISurfaceHost {
public:
  NcursesSurfaceHost() = default;
  ~NcursesSurfaceHost() override;
  NcursesSurfaceHost(const NcursesSurfaceHost&) = delete;
  NcursesSurfaceHost& operator=(const NcursesSurfaceHost&) = delete;

  std::future<HostStatus> create_surface(const std::string& id, const std::string& url, const Rect& rect) override;
  std::future<HostStatus> update_surface_bounds(const std::string& id, const Rect& rect) override;
  std::future<HostStatus> destroy_surface(const std::string& id) override;
  std::future<HostStatus> navigate_surface(const std::string& id, const std::string& url) override;
  std::future<CaptureResult> capture_surface(const std::string& id) override;

  int pump() override;
  void composite() override;

private:
  struct Surface {
    WINDOW* win = nullptr;
    std::string url;
    Rect bounds;
  };
  std::future<HostStatus> queue_status(std::function<HostStatus()> fn);
  HostStatus do_create(const std::string& id, const std::string& url, const Rect& rect);
  HostStatus do_bounds(const std::string& id, const Rect& rect);
  HostStatus do_destroy(const std::string& id);
  void paint(const std::string& id, Surface& s);

  std::map<std::string, Surface> surfaces_;
  std::deque<std::function<void()>> queue_;
};
