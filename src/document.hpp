#pragma once
/*
 * IDocument / TextSnapshot
 *
 * Purpose: read-only view of a document's lines and line-length index.
 * Contract: line_text throws std::out_of_range for a row outside [0, line_count).
 * Note: a snapshot never changes after construction; take a new one after edits.
 */
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include "line_index.hpp"
#include "types.hpp"

class IDocument {
public:
  virtual ~IDocument() = default;
  virtual int line_count() const = 0;
  virtual const std::string& line_text(int row) const = 0;
  virtual const LineIndex& line_index() const = 0;

  size_t total_length() const { return line_index().total_length(); }
  int line_length(int row) const { return static_cast<int>(line_text(row).size()); }
};

class TextSnapshot : public IDocument {
public:
  TextSnapshot();
  explicit TextSnapshot(std::vector<std::string> lines, LineEnding eol = LineEnding::LF);
  TextSnapshot(std::vector<std::string> lines, std::vector<unsigned char> eol_widths);

  static TextSnapshot from_text(std::string_view text);
  static TextSnapshot from_file(const std::filesystem::path& path, std::string& msg, bool& ok);

  int line_count() const override { return static_cast<int>(lines_.size()); }
  const std::string& line_text(int row) const override;
  const LineIndex& line_index() const override { return index_; }

  // terminator that follows row (empty after the last line)
  std::string_view line_ending(int row) const;
  std::string text() const;
  const std::vector<std::string>& lines() const { return lines_; }
  const std::vector<unsigned char>& eol_widths() const { return eols_; }

private:
  void rebuild();

  std::vector<std::string> lines_;
  std::vector<unsigned char> eols_;
  LineIndex index_;
};
