#pragma once
/*
 * EditorOptions
 *
 * Purpose: tab width, tab expansion and extra word bytes read by TextEditor.
 * Config: vim-style "set" lines (set tabstop=8 / set et / set noet /
 *         set wordchars=-$), from code or from an rc file.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include "cmd_registry.hpp"
#include "char_class.hpp"
#include "config.hpp"

struct EditorOptions {
  int tabstop = TC_DEFAULT_TABSTOP;
  bool expandtab = TC_DEFAULT_EXPANDTAB != 0;
  std::string wordchars;

  AsciiCharClassifier classifier() const { return AsciiCharClassifier(wordchars); }
};

class OptionSet {
public:
  explicit OptionSet(EditorOptions& opts);
  OptionSet(const OptionSet&) = delete;
  OptionSet& operator=(const OptionSet&) = delete;

  // one command line, e.g. "set ts=2 et"; a leading ':' is accepted
  bool execute(std::string_view line, std::string& msg);

private:
  void register_options();
  bool set_one(const std::string& item, std::string& msg);

  EditorOptions& opts_;
  CommandRegistry registry_;
};

bool load_options_file(const std::filesystem::path& path, EditorOptions& opts, std::string& msg);

// $HOME/TC_RC_FILE_NAME; a missing file is not an error
bool load_user_options(EditorOptions& opts, std::string& msg);
