#pragma once
/*
 * TerminalSession
 *
 * Purpose: shell process behind a terminal pane (forkpty), with output kept
 * as plain text lines.
 * Notes:
 *   - the master fd is non-blocking; poll() drains whatever is available
 *   - escape sequences are dropped; \r, \b and \t are applied to the current line
 *   - at most `scrollback` finished lines are kept
 *   - release() hangs up and reaps the child; it is idempotent and runs from the destructor
 */
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "posix_fd.hpp"

class TerminalSession {
public:
  TerminalSession(std::string pane_id, size_t scrollback);
  ~TerminalSession();
  TerminalSession(const TerminalSession&) = delete;
  TerminalSession& operator=(const TerminalSession&) = delete;

  bool start(const std::string& shell, const std::optional<std::string>& cwd, int rows, int cols, std::string& msg);
  // true when new output arrived or the process ended.
  bool poll();
  bool write(const std::string& bytes, std::string& msg);
  void resize(int rows, int cols);
  void release();

  bool running() const { return pid_ > 0 && !exited_; }
  bool exited() const { return exited_; }
  int exit_status() const { return exit_status_; }
  const std::string& pane_id() const { return pane_id_; }
  // Last `rows` lines, the unfinished line included.
  std::vector<std::string> tail(int rows) const;
  // Feeds raw output; exposed for tests.
  void feed(const char* data, size_t n);
  size_t line_count() const { return lines_.size() + 1; }

private:
  enum class Esc { None, Start, Csi, Osc, OscEsc };
  void put_char(char c);
  void end_line();
  void reap(bool block);

  std::string pane_id_;
  size_t scrollback_;
  UniqueFd master_;
  pid_t pid_ = -1;
  bool exited_ = false;
  int exit_status_ = 0;
  int rows_ = 0;
  int cols_ = 0;
  std::deque<std::string> lines_;
  std::string current_;
  size_t col_ = 0;
  Esc esc_ = Esc::None;
};
