#include "screen_guard.hpp"
#include "ncurses_terminal.hpp"
#include "ncurses_surface_host.hpp"
#include "workspace.hpp"
#include "config.hpp"
#include "log.hpp"
#include <cstdio>

int main(int argc, char** argv) {
  CliOptions cli;
  std::string msg;
  if (!parse_command_line(argc, argv, cli, msg)) {
    std::fprintf(stderr, "mtile: %s\n%s\n", msg.c_str(), usage_text());
    return 2;
  }
  if (cli.help) {
    std::printf("%s\n", usage_text());
    return 0;
  }
  Config cfg = default_config();
  if (cli.log_path && !Log::open(*cli.log_path, msg)) {
    std::fprintf(stderr, "mtile: %s\n", msg.c_str());
    return 1;
  }

  ScreenGuard screen;
  if (!screen.ok()) {
    std::fprintf(stderr, "mtile: %s\n", screen.error().c_str());
    Log::close();
    return 1;
  }
  NcursesTerminal term;
  NcursesSurfaceHost host;
  Workspace ws(term, host, cfg, Workspace::Options{});
  ws.load_rc(cli.config_path.value_or(default_rc_path()));
  apply_cli(cli, cfg);
  ws.start(cli.files);
  ws.run([&term](int timeout_ms) { return term.read_key(timeout_ms); });
  Log::close();
  return 0;
}
