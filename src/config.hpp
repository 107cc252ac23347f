#pragma once
/*
 * Config
 *
 * Purpose: runtime options, the `set` commands that change them, the rc file
 * (~/.mtilerc) and command-line parsing.
 * rc format: one Ex command per line; blank lines and lines starting with
 * '#', '"' or "//" are skipped; a leading ':' is ignored.
 */
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"

struct Config {
  std::filesystem::path session_path;
  bool restore = true;
  bool persist = true;
  int surface_retry_ms = 200;
  int surface_delay_ms = 100;
  std::string shell;
  std::filesystem::path log_path;
  int scrollback = 1000;
};

Config default_config();
std::filesystem::path default_rc_path();

struct CliOptions {
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> session_path;
  std::optional<std::filesystem::path> log_path;
  bool no_restore = false;
  bool help = false;
  std::vector<std::string> files;
};

bool parse_command_line(int argc, char** argv, CliOptions& out, std::string& msg);
const char* usage_text();
// Command-line values win over rc values.
void apply_cli(const CliOptions& cli, Config& cfg);

// Registers "set session", "set restore", ... Each handler writes `message`
// and calls on_change(option) after a successful change.
void register_config_commands(CommandRegistry& registry, Config& cfg, std::string& message,
                              std::function<void(const std::string&)> on_change = {});

// Executes every command line of `path`. A missing file is not an error.
// Unknown commands are reported through msg but do not stop the load.
bool load_rc(const std::filesystem::path& path, const CommandRegistry& registry, std::string& msg);
