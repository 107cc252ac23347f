#include "config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include "file_io.hpp"
#include "log.hpp"
#include "session_store.hpp"

Config default_config() {
  Config cfg;
  cfg.session_path = default_session_path();
  const char* shell = std::getenv("SHELL");
  cfg.shell = (shell && *shell) ? shell : "/bin/sh";
  return cfg;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return {};
  return std::filesystem::path(home) / ".mtilerc";
}

const char* usage_text() {
  return "usage: mtile [--config PATH] [--session PATH] [--no-restore] [--log PATH] [FILE...]";
}

bool parse_command_line(int argc, char** argv, CliOptions& out, std::string& msg) {
  out = CliOptions{};
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::optional<std::filesystem::path>& dst) {
      if (i + 1 >= argc) { msg = a + " needs a path"; return false; }
      dst = std::filesystem::path(argv[++i]);
      return true;
    };
    if (a == "--config") { if (!value(out.config_path)) return false; }
    else if (a == "--session") { if (!value(out.session_path)) return false; }
    else if (a == "--log") { if (!value(out.log_path)) return false; }
    else if (a == "--no-restore") out.no_restore = true;
    else if (a == "-h" || a == "--help") out.help = true;
    else if (a == "--") { for (++i; i < argc; ++i) out.files.emplace_back(argv[i]); }
    else if (a.size() > 1 && a[0] == '-') { msg = "unknown option: " + a; return false; }
    else out.files.push_back(a);
  }
  return true;
}

void apply_cli(const CliOptions& cli, Config& cfg) {
  if (cli.session_path) cfg.session_path = *cli.session_path;
  if (cli.log_path) cfg.log_path = *cli.log_path;
  if (cli.no_restore) cfg.restore = false;
}

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

void register_config_commands(CommandRegistry& registry, Config& cfg, std::string& message,
                              std::function<void(const std::string&)> on_change) {
  auto changed = [on_change](const std::string& name) { if (on_change) on_change(name); };

  auto add_switch = [&](const std::string& name, bool Config::*field) {
    registry.register_command("set " + name, [&cfg, &message, name, field, changed](const std::vector<std::string>& args) {
      bool v = false;
      if (!parse_switch(args, cfg.*field, v)) { message = "set " + name + ": use :set " + name + " on|off"; return; }
      cfg.*field = v;
      message = name + (v ? " on" : " off");
      changed(name);
    });
  };
  add_switch("restore", &Config::restore);
  add_switch("persist", &Config::persist);

  auto add_number = [&](const std::string& name, int Config::*field, int min) {
    registry.register_command("set " + name, [&cfg, &message, name, field, min, changed](const std::vector<std::string>& args) {
      int v = 0;
      if (args.empty()) { message = name + "=" + std::to_string(cfg.*field); return; }
      if (!parse_int(args[0], v)) { message = "set " + name + ": value must be a number"; return; }
      if (v < min) { message = "set " + name + ": value must be >= " + std::to_string(min); return; }
      cfg.*field = v;
      message = name + "=" + std::to_string(v);
      changed(name);
    });
  };
  add_number("surfaceretry", &Config::surface_retry_ms, 1);
  add_number("surfacedelay", &Config::surface_delay_ms, 0);
  add_number("scrollback", &Config::scrollback, 10);

  registry.register_command("set session", [&cfg, &message, changed](const std::vector<std::string>& args) {
    if (args.empty()) { message = "session=" + cfg.session_path.string(); return; }
    cfg.session_path = args[0];
    message = "session=" + args[0];
    changed("session");
  });
  registry.register_command("set shell", [&cfg, &message, changed](const std::vector<std::string>& args) {
    if (args.empty()) { message = "shell=" + cfg.shell; return; }
    cfg.shell = args[0];
    message = "shell=" + args[0];
    changed("shell");
  });
  registry.register_command("set log", [&cfg, &message, changed](const std::vector<std::string>& args) {
    if (args.empty()) { message = "log=" + cfg.log_path.string(); return; }
    std::string err;
    if (!Log::open(args[0], err)) { message = "set log: " + err; return; }
    cfg.log_path = args[0];
    message = "log=" + args[0];
    changed("log");
  });
}

bool load_rc(const std::filesystem::path& path, const CommandRegistry& registry, std::string& msg) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!read_file_lines(path, lines, msg)) return false;
  int lineno = 0;
  for (std::string s : lines) {
    ++lineno;
    auto isspace_fn = [](unsigned char c) { return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
    size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (!registry.dispatch(s, err)) {
      msg = path.filename().string() + ":" + std::to_string(lineno) + ": " + err;
      log_warn("config", msg);
    }
  }
  return true;
}
