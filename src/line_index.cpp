#include "line_index.hpp"
#include <algorithm>

LineIndex::LineIndex(size_t block_size) : block_size_(std::max<size_t>(1, block_size)) {}

void LineIndex::build(const std::vector<std::string>& lines, const std::vector<unsigned char>& eol_widths) {
  blocks_.clear();
  lengths_.clear();
  eols_.clear();
  total_ = 0;
  size_t n = lines.size();
  lengths_.reserve(n);
  eols_.reserve(n);
  std::vector<size_t> starts;
  starts.reserve(n);
  size_t off = 0;
  for (size_t i = 0; i < n; ++i) {
    unsigned char eol = (i + 1 < n && i < eol_widths.size()) ? eol_widths[i] : 0;
    starts.push_back(off);
    lengths_.push_back(lines[i].size());
    eols_.push_back(eol);
    off += lines[i].size() + eol;
  }
  total_ = off;
  for (size_t i = 0; i < n; i += block_size_) {
    size_t end = std::min(n, i + block_size_);
    LineBlock b;
    b.base_offset = starts[i];
    b.rel.reserve(end - i);
    for (size_t k = i; k < end; ++k) b.rel.push_back(starts[k] - b.base_offset);
    blocks_.push_back(std::move(b));
  }
}

size_t LineIndex::line_start(size_t row) const {
  if (blocks_.empty()) return 0;
  size_t bi = row / block_size_;
  if (bi >= blocks_.size()) return total_;
  const LineBlock& b = blocks_[bi];
  size_t idx = row - bi * block_size_;
  if (idx >= b.rel.size()) return total_;
  return b.base_offset + b.rel[idx];
}

size_t LineIndex::line_length(size_t row) const {
  if (row >= lengths_.size()) return 0;
  return lengths_[row];
}

size_t LineIndex::eol_width(size_t row) const {
  if (row >= eols_.size()) return 0;
  return eols_[row];
}

size_t LineIndex::row_at_offset(size_t offset) const {
  if (blocks_.empty()) return 0;
  auto bit = std::upper_bound(blocks_.begin(), blocks_.end(), offset,
                              [](size_t off, const LineBlock& b) { return off < b.base_offset; });
  // blocks_[0].base_offset is 0, so bit never points at begin()
  size_t bi = static_cast<size_t>(bit - blocks_.begin()) - 1;
  const LineBlock& b = blocks_[bi];
  size_t rel = offset - b.base_offset;
  auto rit = std::upper_bound(b.rel.begin(), b.rel.end(), rel);
  size_t idx = static_cast<size_t>(rit - b.rel.begin()) - 1;
  return bi * block_size_ + idx;
}
