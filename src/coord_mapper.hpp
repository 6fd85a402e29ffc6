#pragma once
/*
 * CoordMapper
 *
 * Purpose: linear offset <-> Position over a LineIndex.
 * Note: inputs past the index clamp to the last line / total length;
 *       an offset inside a \r\n terminator maps to the end of its line.
 */
#include <cstddef>
#include "line_index.hpp"
#include "position.hpp"

Position offset_to_position(size_t offset, const LineIndex& index);
size_t position_to_offset(Position pos, const LineIndex& index);
