#include "coord_mapper.hpp"
#include <algorithm>

Position offset_to_position(size_t offset, const LineIndex& index) {
  if (index.line_count() == 0) return Position(0, 0);
  offset = std::min(offset, index.total_length());
  size_t row = index.row_at_offset(offset);
  size_t ch = std::min(offset - index.line_start(row), index.line_length(row));
  return Position(static_cast<int>(row), static_cast<int>(ch));
}

size_t position_to_offset(Position pos, const LineIndex& index) {
  if (index.line_count() == 0) return 0;
  size_t row = std::min(static_cast<size_t>(pos.line()), index.line_count() - 1);
  size_t ch = std::min(static_cast<size_t>(pos.character()), index.line_length(row));
  return index.line_start(row) + ch;
}
