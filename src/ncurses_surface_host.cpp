#include "ncurses_surface_host.hpp"
#include <algorithm>
#include <memory>
#include "url_validator.hpp"

NcursesSurfaceHost::~NcursesSurfaceHost() {
  for (auto& [id, s] : surfaces_) if (s.win) delwin(s.win);
}

std::future<HostStatus> NcursesSurfaceHost::queue_status(std::function<HostStatus()> fn) {
  auto p = std::make_shared<std::promise<HostStatus>>();
  auto fut = p->get_future();
  queue_.push_back([p, fn = std::move(fn)] { p->set_value(fn()); });
  return fut;
}

int NcursesSurfaceHost::pump() {
  int n = 0;
  size_t batch = queue_.size();
  while (batch-- > 0 && !queue_.empty()) {
    auto task = std::move(queue_.front());
    queue_.pop_front();
    task();
    n++;
  }
  return n;
}

// The window keeps its size while hidden; only visibility changes.
static WINDOW* make_window(const Rect& r) {
  int h = std::max(1, r.height), w = std::max(1, r.width);
  if (is_offscreen(r)) return newwin(h, w, 0, 0);
  return newwin(h, w, std::max(0, r.row), std::max(0, r.col));
}

HostStatus NcursesSurfaceHost::do_create(const std::string& id, const std::string& url, const Rect& rect) {
  auto it = surfaces_.find(id);
  if (it != surfaces_.end() && it->second.win) delwin(it->second.win);
  WINDOW* win = make_window(rect);
  if (!win) return HostStatus::failure("cannot create window for " + id);
  surfaces_[id] = Surface{win, url, rect};
  return HostStatus::success();
}

HostStatus NcursesSurfaceHost::do_bounds(const std::string& id, const Rect& rect) {
  auto it = surfaces_.find(id);
  if (it == surfaces_.end()) return HostStatus::failure("no such surface: " + id);
  Surface& s = it->second;
  s.bounds = rect;
  if (is_offscreen(rect) || rect.empty()) return HostStatus::success();
  // Shrink first so the move cannot push the window past the screen edge.
  wresize(s.win, 1, 1);
  if (mvwin(s.win, std::max(0, rect.row), std::max(0, rect.col)) == ERR ||
      wresize(s.win, rect.height, rect.width) == ERR) {
    return HostStatus::failure("cannot place surface " + id);
  }
  return HostStatus::success();
}

HostStatus NcursesSurfaceHost::do_destroy(const std::string& id) {
  auto it = surfaces_.find(id);
  if (it == surfaces_.end()) return HostStatus::failure("no such surface: " + id);
  if (it->second.win) delwin(it->second.win);
  surfaces_.erase(it);
  touchwin(stdscr);
  return HostStatus::success();
}

std::future<HostStatus> NcursesSurfaceHost::create_surface(const std::string& id, const std::string& url, const Rect& rect) {
  return queue_status([this, id, url, rect] { return do_create(id, url, rect); });
}

std::future<HostStatus> NcursesSurfaceHost::update_surface_bounds(const std::string& id, const Rect& rect) {
  return queue_status([this, id, rect] { return do_bounds(id, rect); });
}

std::future<HostStatus> NcursesSurfaceHost::destroy_surface(const std::string& id) {
  return queue_status([this, id] { return do_destroy(id); });
}

std::future<HostStatus> NcursesSurfaceHost::navigate_surface(const std::string& id, const std::string& url) {
  return queue_status([this, id, url] {
    auto it = surfaces_.find(id);
    if (it == surfaces_.end()) return HostStatus::failure("no such surface: " + id);
    it->second.url = url;
    return HostStatus::success();
  });
}

std::future<CaptureResult> NcursesSurfaceHost::capture_surface(const std::string& id) {
  auto p = std::make_shared<std::promise<CaptureResult>>();
  auto fut = p->get_future();
  queue_.push_back([this, id, p] {
    CaptureResult r;
    auto it = surfaces_.find(id);
    if (it == surfaces_.end()) {
      r.status = HostStatus::failure("no such surface: " + id);
      p->set_value(std::move(r));
      return;
    }
    Surface& s = it->second;
    paint(id, s);
    int h, w;
    getmaxyx(s.win, h, w);
    r.image.height = h;
    r.image.width = w;
    std::string line(static_cast<size_t>(w) + 1, '\0');
    for (int y = 0; y < h; ++y) {
      int n = mvwinnstr(s.win, y, 0, line.data(), w);
      r.image.rows.emplace_back(line.data(), n > 0 ? static_cast<size_t>(n) : 0u);
    }
    p->set_value(std::move(r));
  });
  return fut;
}

// Stand-in page: there is no browser engine behind a character cell window.
void NcursesSurfaceHost::paint(const std::string& id, Surface& s) {
  werase(s.win);
  box(s.win, 0, 0);
  int h, w;
  getmaxyx(s.win, h, w);
  if (h < 3 || w < 4) return;
  std::string host = url_host(s.url);
  mvwaddnstr(s.win, 0, 2, (" " + (host.empty() ? s.url : host) + " ").c_str(), w - 4);
  mvwaddnstr(s.win, 1, 2, s.url.c_str(), w - 4);
  if (h > 3) mvwaddnstr(s.win, h - 2, 2, id.c_str(), w - 4);
}

void NcursesSurfaceHost::composite() {
  for (auto& [id, s] : surfaces_) {
    if (!s.win || is_offscreen(s.bounds) || s.bounds.empty()) continue;
    paint(id, s);
    wnoutrefresh(s.win);
  }
}
