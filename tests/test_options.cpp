#include "options.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <cstdlib>
#include <unistd.h>

static std::filesystem::path temp_file(const std::string& name, const std::string& body) {
  auto p = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(::getpid()));
  std::ofstream out(p, std::ios::binary);
  out << body;
  return p;
}

static void test_set_commands() {
  EditorOptions o;
  assert(o.tabstop == TC_DEFAULT_TABSTOP);
  assert(o.expandtab == (TC_DEFAULT_EXPANDTAB != 0));
  OptionSet set(o);
  std::string msg;
  assert(set.execute("set tabstop=8", msg));
  assert(o.tabstop == 8);
  assert(msg == "tabstop=8");
  assert(set.execute(":set ts=2 et", msg));
  assert(o.tabstop == 2);
  assert(o.expandtab);
  assert(msg == "tabstop=2 expandtab");
  assert(set.execute("se noet", msg));
  assert(!o.expandtab);
  assert(set.execute("set wordchars=-$", msg));
  assert(o.wordchars == "-$");
  assert(o.classifier().is_word('-'));
}

static void test_rejects() {
  EditorOptions o;
  OptionSet set(o);
  std::string msg;
  assert(!set.execute("set tabstop=0", msg));
  assert(msg == "set tabstop: width must be >= 1");
  assert(!set.execute("set tabstop=abc", msg));
  assert(!set.execute("set tabstop=99999999999999999999", msg));
  assert(msg == "set tabstop: invalid number");
  assert(!set.execute("set ts=2147483647", msg));
  assert(msg == "set tabstop: width must be <= " + std::to_string(TC_MAX_TABSTOP));
  assert(!set.execute("set ts=" + std::to_string(TC_MAX_TABSTOP + 1), msg));
  assert(o.tabstop == TC_DEFAULT_TABSTOP);
  assert(set.execute("set ts=" + std::to_string(TC_MAX_TABSTOP), msg));
  assert(o.tabstop == TC_MAX_TABSTOP);
  assert(set.execute("set ts=" + std::to_string(TC_DEFAULT_TABSTOP), msg));
  assert(!set.execute("set shiftwidth=2", msg));
  assert(msg == "unknown option: shiftwidth");
  assert(!set.execute("map x y", msg));
  assert(!set.execute("set", msg));
  // all or nothing
  assert(!set.execute("set ts=3 et bogus", msg));
  assert(o.tabstop == TC_DEFAULT_TABSTOP);
  assert(!o.expandtab);
}

static void test_file() {
  auto p = temp_file("textcoord_rc", "# comment\n\" vim comment\n// slash comment\n\n  :set ts=3\nset expandtab\r\n");
  EditorOptions o;
  std::string msg;
  assert(load_options_file(p, o, msg));
  assert(o.tabstop == 3);
  assert(o.expandtab);
  std::filesystem::remove(p);

  auto bad = temp_file("textcoord_badrc", "set ts=5\nset nope\nset et\n");
  EditorOptions o2;
  assert(!load_options_file(bad, o2, msg));
  assert(msg == bad.string() + ":2: unknown option: nope");
  assert(o2.tabstop == 5);
  assert(o2.expandtab);
  std::filesystem::remove(bad);

  EditorOptions o3;
  assert(!load_options_file("/nonexistent/textcoordrc", o3, msg));
  assert(msg == "can not open file: /nonexistent/textcoordrc");
}

static void test_user_file() {
  auto home = std::filesystem::temp_directory_path() / ("textcoord_home_" + std::to_string(::getpid()));
  std::filesystem::create_directories(home);
  ::setenv("HOME", home.string().c_str(), 1);
  EditorOptions o;
  std::string msg;
  assert(load_user_options(o, msg));
  assert(msg.empty());
  assert(o.tabstop == TC_DEFAULT_TABSTOP);
  {
    std::ofstream out(home / TC_RC_FILE_NAME, std::ios::binary);
    out << "set ts=6 et\n";
  }
  assert(load_user_options(o, msg));
  assert(o.tabstop == 6);
  assert(o.expandtab);
  std::filesystem::remove_all(home);
}

int main() {
  test_set_commands();
  test_rejects();
  test_file();
  test_user_file();
  return 0;
}
