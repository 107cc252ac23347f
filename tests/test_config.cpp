#include "config.hpp"
#include "file_io.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

static void test_split_command_line() {
  std::string name;
  std::vector<std::string> args;
  split_command_line("tabmove 1 3", name, args);
  assert(name == "tabmove");
  assert((args == std::vector<std::string>{"1", "3"}));
  split_command_line("set scrollback=500", name, args);
  assert(name == "set scrollback");
  assert((args == std::vector<std::string>{"500"}));
  split_command_line("set shell /bin/zsh", name, args);
  assert(name == "set shell");
  assert((args == std::vector<std::string>{"/bin/zsh"}));
  split_command_line("set", name, args);
  assert(name == "set" && args.empty());
  split_command_line("   ", name, args);
  assert(name.empty());
}

static void test_set_commands() {
  CommandRegistry reg;
  Config cfg = default_config();
  std::string message;
  std::vector<std::string> changes;
  register_config_commands(reg, cfg, message, [&](const std::string& opt) { changes.push_back(opt); });
  std::string err;

  assert(reg.dispatch("set restore off", err));
  assert(!cfg.restore);
  assert(message == "restore off");
  assert(reg.dispatch("set restore", err)); // bare switch toggles
  assert(cfg.restore);
  assert(reg.dispatch("set persist=maybe", err));
  assert(cfg.persist);
  assert(message.find("on|off") != std::string::npos);

  assert(reg.dispatch("set scrollback=5000", err));
  assert(cfg.scrollback == 5000);
  assert(reg.dispatch("set scrollback 3", err));
  assert(cfg.scrollback == 5000);
  assert(reg.dispatch("set surfaceretry=12ms", err));
  assert(cfg.surface_retry_ms == 200);
  assert(message.find("number") != std::string::npos);
  assert(reg.dispatch("set surfacedelay 0", err));
  assert(cfg.surface_delay_ms == 0);
  assert(reg.dispatch("set surfacedelay", err));
  assert(message == "surfacedelay=0");

  assert(reg.dispatch("set session /tmp/s.json", err));
  assert(cfg.session_path == "/tmp/s.json");
  assert(reg.dispatch("set shell=/bin/bash", err));
  assert(cfg.shell == "/bin/bash");

  assert((changes == std::vector<std::string>{"restore", "restore", "scrollback", "surfacedelay", "session", "shell"}));
  assert(!reg.dispatch("set bogus=1", err));
  assert(err == "unknown command: set bogus");
}

static void test_load_rc() {
  auto dir = std::filesystem::temp_directory_path() / ("mtile-config-test-" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  auto rc = dir / "mtilerc";
  std::string msg;
  assert(write_file_atomic(rc,
                           "# comment\n"
                           "\" vim style comment\n"
                           "// c style comment\n"
                           "\n"
                           "  set scrollback=2000  \r\n"
                           ":set persist off\n"
                           "frobnicate now\n"
                           "set restore=off\n",
                           msg));
  CommandRegistry reg;
  Config cfg = default_config();
  std::string message;
  register_config_commands(reg, cfg, message);
  assert(load_rc(rc, reg, msg));
  assert(cfg.scrollback == 2000);
  assert(!cfg.persist);
  assert(!cfg.restore); // lines after a bad one still run
  assert(msg == "mtilerc:7: unknown command: frobnicate");

  std::string none;
  assert(load_rc(dir / "missing", reg, none));
  assert(none.empty());
  std::filesystem::remove_all(dir);
}

static void test_command_line() {
  std::vector<std::string> words = {"mtile", "--session", "/tmp/a.json", "--no-restore", "notes.md", "--", "--weird"};
  std::vector<char*> argv;
  for (auto& w : words) argv.push_back(w.data());
  CliOptions cli;
  std::string msg;
  assert(parse_command_line(static_cast<int>(argv.size()), argv.data(), cli, msg));
  assert(cli.session_path && *cli.session_path == "/tmp/a.json");
  assert(cli.no_restore);
  assert((cli.files == std::vector<std::string>{"notes.md", "--weird"}));

  Config cfg = default_config();
  apply_cli(cli, cfg);
  assert(cfg.session_path == "/tmp/a.json");
  assert(!cfg.restore);

  std::vector<std::string> bad = {"mtile", "--colour"};
  std::vector<char*> bad_argv;
  for (auto& w : bad) bad_argv.push_back(w.data());
  assert(!parse_command_line(static_cast<int>(bad_argv.size()), bad_argv.data(), cli, msg));
  assert(msg == "unknown option: --colour");

  std::vector<std::string> dangling = {"mtile", "--log"};
  std::vector<char*> dangling_argv;
  for (auto& w : dangling) dangling_argv.push_back(w.data());
  assert(!parse_command_line(static_cast<int>(dangling_argv.size()), dangling_argv.data(), cli, msg));
  assert(msg == "--log needs a path");
}

int main() {
  test_split_command_line();
  test_set_commands();
  test_load_rc();
  test_command_line();
  return 0;
}
