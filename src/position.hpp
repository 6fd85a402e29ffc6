#pragma once
/*
 * Position / Range
 *
 * Purpose: immutable line/character coordinate with word motions.
 * Word rules: a word is a maximal run of one non-Space CharClass; an empty
 *             line counts as a single word start so motions stop on it.
 * Note: motions read lines through IDocument; a row outside the document
 *       surfaces as std::out_of_range, a character overflow is clamped.
 */
#include <compare>
#include <string_view>
#include <vector>
#include "char_class.hpp"
#include "document.hpp"

class Position {
public:
  Position() = default;
  Position(int line, int character) : line_(line < 0 ? 0 : line), character_(character < 0 ? 0 : character) {}

  int line() const { return line_; }
  int character() const { return character_; }

  Position get_left() const;
  Position get_right(const IDocument& doc) const;
  Position get_line_begin() const { return Position(line_, 0); }
  Position get_line_end(const IDocument& doc) const;
  Position get_first_line_non_blank_char(const IDocument& doc,
                                         const CharClassifier& cls = default_classifier()) const;

  Position get_word_left(const IDocument& doc, bool inclusive = false,
                         const CharClassifier& cls = default_classifier()) const;
  Position get_word_right(const IDocument& doc, bool inclusive = false,
                          const CharClassifier& cls = default_classifier()) const;
  Position get_current_word_end(const IDocument& doc, bool inclusive = false,
                                const CharClassifier& cls = default_classifier()) const;

  bool is_line_end(const IDocument& doc) const;

  bool operator==(const Position&) const = default;
  std::strong_ordering operator<=>(const Position& o) const {
    if (line_ != o.line_) return line_ <=> o.line_;
    return character_ <=> o.character_;
  }

private:
  int line_ = 0;
  int character_ = 0;
};

struct Range {
  Position start;
  Position end;

  Range() = default;
  Range(Position a, Position b) : start(a < b ? a : b), end(a < b ? b : a) {}

  bool empty() const { return start == end; }
  bool contains(Position p) const { return start <= p && p <= end; }
  bool operator==(const Range&) const = default;
};

std::vector<int> word_starts(std::string_view line, const CharClassifier& cls);
std::vector<int> word_ends(std::string_view line, const CharClassifier& cls);
