#include "terminal_session.hpp"
#include <cerrno>
#include <cstdio>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <chrono>
#include <thread>
#include <unistd.h>
#include "log.hpp"

static constexpr int kReadChunk = 4096;
static constexpr int kReapAttempts = 20;

TerminalSession::TerminalSession(std::string pane_id, size_t scrollback)
    : pane_id_(std::move(pane_id)), scrollback_(scrollback == 0 ? 1 : scrollback) {}

TerminalSession::~TerminalSession() { release(); }

bool TerminalSession::start(const std::string& shell, const std::optional<std::string>& cwd, int rows, int cols,
                            std::string& msg) {
  if (pid_ > 0) { msg = "terminal already started"; return false; }
  struct winsize ws{};
  ws.ws_row = static_cast<unsigned short>(rows > 0 ? rows : 24);
  ws.ws_col = static_cast<unsigned short>(cols > 0 ? cols : 80);
  int master = -1;
  pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
  if (pid < 0) { msg = std::string("forkpty failed: ") + std::strerror(errno); return false; }
  if (pid == 0) {
    // The message lands in the pane; the shell then starts in the inherited directory.
    if (cwd && !cwd->empty() && ::chdir(cwd->c_str()) != 0) std::fprintf(stderr, "mtile: cannot cd to %s\n", cwd->c_str());
    ::setenv("TERM", "dumb", 1);
    ::execlp(shell.c_str(), shell.c_str(), static_cast<char*>(nullptr));
    std::_Exit(127);
  }
  master_.reset(master);
  if (!set_nonblocking_cloexec(master)) {
    msg = std::string("fcntl failed: ") + std::strerror(errno);
    pid_ = pid;
    release();
    return false;
  }
  pid_ = pid;
  exited_ = false;
  rows_ = ws.ws_row;
  cols_ = ws.ws_col;
  log_info("term", "started " + shell + " (pid " + std::to_string(pid) + ") for " + pane_id_);
  return true;
}

bool TerminalSession::poll() {
  if (!master_.valid()) return false;
  bool progress = false;
  char buf[kReadChunk];
  for (;;) {
    ssize_t n = ::read(master_.get(), buf, sizeof(buf));
    if (n > 0) { feed(buf, static_cast<size_t>(n)); progress = true; continue; }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
    // EOF or EIO: the slave side is gone.
    master_.reset();
    reap(false);
    exited_ = true;
    progress = true;
    break;
  }
  return progress;
}

bool TerminalSession::write(const std::string& bytes, std::string& msg) {
  if (!master_.valid()) { msg = "terminal not running"; return false; }
  if (!write_all(master_.get(), bytes.data(), bytes.size())) {
    msg = std::string("terminal write failed: ") + std::strerror(errno);
    return false;
  }
  return true;
}

void TerminalSession::resize(int rows, int cols) {
  if (!master_.valid() || rows <= 0 || cols <= 0) return;
  if (rows == rows_ && cols == cols_) return;
  struct winsize ws{};
  ws.ws_row = static_cast<unsigned short>(rows);
  ws.ws_col = static_cast<unsigned short>(cols);
  if (::ioctl(master_.get(), TIOCSWINSZ, &ws) != 0) {
    log_warn("term", "resize failed for " + pane_id_ + ": " + std::strerror(errno));
    return;
  }
  rows_ = rows;
  cols_ = cols;
}

void TerminalSession::reap(bool block) {
  if (pid_ <= 0) return;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  if (r == pid_) {
    exit_status_ = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    pid_ = -1;
  }
}

void TerminalSession::release() {
  if (pid_ <= 0 && !master_.valid()) return;
  if (pid_ > 0) ::kill(pid_, SIGHUP);
  master_.reset();
  for (int i = 0; i < kReapAttempts && pid_ > 0; ++i) {
    reap(false);
    if (pid_ > 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (pid_ > 0) {
    log_warn("term", "shell for " + pane_id_ + " ignored SIGHUP, killing");
    ::kill(pid_, SIGKILL);
    reap(true);
  }
  exited_ = true;
  log_info("term", "released " + pane_id_);
}

std::vector<std::string> TerminalSession::tail(int rows) const {
  std::vector<std::string> out;
  if (rows <= 0) return out;
  size_t want = static_cast<size_t>(rows);
  size_t from_lines = want > 1 ? want - 1 : 0;
  size_t start = lines_.size() > from_lines ? lines_.size() - from_lines : 0;
  for (size_t i = start; i < lines_.size(); ++i) out.push_back(lines_[i]);
  out.push_back(current_);
  return out;
}

void TerminalSession::end_line() {
  lines_.push_back(std::move(current_));
  current_.clear();
  col_ = 0;
  while (lines_.size() > scrollback_) lines_.pop_front();
}

void TerminalSession::put_char(char c) {
  switch (c) {
    case '\n': end_line(); return;
    case '\r': col_ = 0; return;
    case '\b': if (col_ > 0) col_--; return;
    case '\t': {
      size_t next = (col_ / 8 + 1) * 8;
      while (col_ < next) put_char(' ');
      return;
    }
    default: break;
  }
  if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) return;
  if (col_ < current_.size()) current_[col_] = c;
  else current_.push_back(c);
  col_++;
}

void TerminalSession::feed(const char* data, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    char c = data[i];
    switch (esc_) {
      case Esc::None:
        if (c == '\x1b') esc_ = Esc::Start;
        else put_char(c);
        break;
      case Esc::Start:
        if (c == '[') esc_ = Esc::Csi;
        else if (c == ']') esc_ = Esc::Osc;
        else esc_ = Esc::None;
        break;
      case Esc::Csi:
        if (c >= 0x40 && c <= 0x7e) esc_ = Esc::None;
        break;
      case Esc::Osc:
        if (c == '\a') esc_ = Esc::None;
        else if (c == '\x1b') esc_ = Esc::OscEsc;
        break;
      case Esc::OscEsc:
        esc_ = (c == '\\') ? Esc::None : Esc::Osc;
        break;
    }
  }
}
