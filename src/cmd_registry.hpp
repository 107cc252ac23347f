#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands (interactive `:` line and rc file).
 * Design: map name → handler (args vector). `set name=value` and
 * `set name value` both route to the handler registered as "set name".
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  // Parses one command line; false with msg when no handler matches.
  bool dispatch(const std::string& line, std::string& msg) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

// Splits "name args..." on whitespace; "set x=y" becomes ("set x", {"y"}).
void split_command_line(const std::string& line, std::string& name, std::vector<std::string>& args);
