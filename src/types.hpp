#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums/structs (CharClass/LineEnding).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

enum class CharClass { Space, Word, Punct };

enum class LineEnding { LF, CRLF };

inline size_t eol_width(LineEnding e) { return e == LineEnding::CRLF ? 2 : 1; }
