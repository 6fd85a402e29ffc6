#pragma once
/*
 * LineIndex
 *
 * Purpose: per-line length/terminator table plus cumulative line starts.
 * Layout: starts kept in blocks (base offset + relative starts) so a lookup
 *         by offset is a binary search over blocks, then inside one block.
 */
#include <vector>
#include <string>
#include <cstddef>
#include "config.hpp"

struct LineBlock {
  size_t base_offset;
  std::vector<size_t> rel;
};

class LineIndex {
public:
  explicit LineIndex(size_t block_size = TC_LINE_BLOCK_SIZE);

  // eol_widths[i] is the terminator width after line i (0 for the last line)
  void build(const std::vector<std::string>& lines, const std::vector<unsigned char>& eol_widths);

  size_t line_count() const { return lengths_.size(); }
  size_t line_start(size_t row) const;
  size_t line_length(size_t row) const;
  size_t eol_width(size_t row) const;
  size_t total_length() const { return total_; }
  // last row whose start is <= offset; offsets past the end land on the last row
  size_t row_at_offset(size_t offset) const;

private:
  std::vector<LineBlock> blocks_;
  std::vector<size_t> lengths_;
  std::vector<unsigned char> eols_;
  size_t total_ = 0;
  size_t block_size_;
};
