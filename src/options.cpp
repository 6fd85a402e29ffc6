#include "options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "file_reader.hpp"

static std::string trim(std::string_view s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return std::string(s.substr(i, j - i));
}

OptionSet::OptionSet(EditorOptions& opts) : opts_(opts) {
  register_options();
}

void OptionSet::register_options() {
  auto tabstop = [this](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "tabstop=" + std::to_string(opts_.tabstop); return true; }
    const std::string& s = args[0];
    bool ok = !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { msg = "set tabstop: width must be a number"; return false; }
    int w = 0;
    try { w = std::stoi(s); } catch (const std::out_of_range&) { msg = "set tabstop: invalid number"; return false; }
    if (w < 1) { msg = "set tabstop: width must be >= 1"; return false; }
    if (w > TC_MAX_TABSTOP) { msg = "set tabstop: width must be <= " + std::to_string(TC_MAX_TABSTOP); return false; }
    opts_.tabstop = w;
    msg = "tabstop=" + std::to_string(w);
    return true;
  };
  registry_.register_command("tabstop", tabstop);
  registry_.register_command("ts", tabstop);

  auto expandtab = [this](const std::vector<std::string>& args, std::string& msg) {
    if (!args.empty()) { msg = "set expandtab: takes no value"; return false; }
    opts_.expandtab = true;
    msg = "expandtab";
    return true;
  };
  auto noexpandtab = [this](const std::vector<std::string>& args, std::string& msg) {
    if (!args.empty()) { msg = "set noexpandtab: takes no value"; return false; }
    opts_.expandtab = false;
    msg = "noexpandtab";
    return true;
  };
  registry_.register_command("expandtab", expandtab);
  registry_.register_command("et", expandtab);
  registry_.register_command("noexpandtab", noexpandtab);
  registry_.register_command("noet", noexpandtab);

  registry_.register_command("wordchars", [this](const std::vector<std::string>& args, std::string& msg) {
    opts_.wordchars = args.empty() ? std::string() : args[0];
    msg = "wordchars=" + opts_.wordchars;
    return true;
  });
}

bool OptionSet::set_one(const std::string& item, std::string& msg) {
  size_t eq = item.find('=');
  std::vector<std::string> args;
  std::string name = item;
  if (eq != std::string::npos) {
    name = item.substr(0, eq);
    args.push_back(item.substr(eq + 1));
  }
  return registry_.execute(name, args, msg);
}

bool OptionSet::execute(std::string_view line, std::string& msg) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s = trim(std::string_view(s).substr(1));
  std::istringstream iss(s);
  std::string cmd;
  iss >> cmd;
  if (cmd != "set" && cmd != "se") { msg = "unknown command: " + cmd; return false; }
  std::vector<std::string> items;
  std::string item;
  while (iss >> item) items.push_back(item);
  if (items.empty()) { msg = "set: missing option"; return false; }
  // apply to a copy so a bad item leaves the options untouched
  EditorOptions saved = opts_;
  std::vector<std::string> reports;
  for (const auto& it : items) {
    std::string m;
    if (!set_one(it, m)) { opts_ = saved; msg = m; return false; }
    reports.push_back(m);
  }
  msg.clear();
  for (size_t i = 0; i < reports.size(); ++i) {
    if (i) msg += ' ';
    msg += reports[i];
  }
  return true;
}

bool load_options_file(const std::filesystem::path& path, EditorOptions& opts, std::string& msg) {
  std::vector<std::string> lines;
  std::vector<unsigned char> eols;
  if (!mmap_read_lines(path, lines, eols, msg)) return false;
  OptionSet set(opts);
  bool all_ok = true;
  std::string first_error;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string s = trim(lines[i]);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (!set.execute(s, m) && all_ok) {
      all_ok = false;
      first_error = path.string() + ":" + std::to_string(i + 1) + ": " + m;
    }
  }
  msg = all_ok ? std::string("loaded options: ") + path.string() : first_error;
  return all_ok;
}

bool load_user_options(EditorOptions& opts, std::string& msg) {
  const char* home = std::getenv("HOME");
  if (!home) { msg.clear(); return true; }
  auto p = std::filesystem::path(home) / TC_RC_FILE_NAME;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) { msg.clear(); return true; }
  return load_options_file(p, opts, msg);
}
