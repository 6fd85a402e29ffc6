#pragma once
/*
 * TextBuffer
 *
 * Purpose: host-side document: owns the current lines, applies TextEdits,
 *          hands out immutable TextSnapshots for the coordinate core.
 * Feature: safe writes (write .tmp -> fdatasync -> atomic rename).
 * Note: version() grows by one per applied edit; single-threaded.
 */
#include <string>
#include <vector>
#include <filesystem>
#include <optional>
#include "document.hpp"
#include "text_edit.hpp"

class TextBuffer : public IEditTarget {
public:
  TextBuffer() = default;
  explicit TextBuffer(TextSnapshot snap) : snap_(std::move(snap)) {}

  const TextSnapshot& snapshot() const { return snap_; }
  int version() const { return version_; }
  bool modified() const { return modified_; }
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }
  int line_count() const { return snap_.line_count(); }

  bool apply(const TextEdit& edit, std::string& msg) override;

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg);

private:
  bool in_range(Position p) const;

  TextSnapshot snap_;
  int version_ = 1;
  bool modified_ = false;
  std::optional<std::filesystem::path> file_path_;
};
