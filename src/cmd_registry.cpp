#include "cmd_registry.hpp"
#include <sstream>

void split_command_line(const std::string& line, std::string& name, std::vector<std::string>& args) {
  name.clear();
  args.clear();
  std::istringstream iss(line);
  iss >> name;
  std::string a;
  while (iss >> a) args.push_back(a);
  if (name != "set" || args.empty()) return;
  std::string opt = args[0];
  std::string value;
  size_t eq = opt.find('=');
  if (eq != std::string::npos) {
    value = opt.substr(eq + 1);
    opt = opt.substr(0, eq);
  }
  name = "set " + opt;
  std::vector<std::string> sub;
  if (!value.empty()) sub.push_back(value);
  for (size_t i = 1; i < args.size(); ++i) sub.push_back(args[i]);
  args = std::move(sub);
}

bool CommandRegistry::dispatch(const std::string& line, std::string& msg) const {
  std::string name;
  std::vector<std::string> args;
  split_command_line(line, name, args);
  if (name.empty()) return true;
  if (!execute(name, args)) { msg = "unknown command: " + name; return false; }
  return true;
}
