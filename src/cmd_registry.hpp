#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named option commands.
 * Design: map name -> handler (args vector, message out); the caller parses.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown option: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
