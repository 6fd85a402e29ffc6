#include "position.hpp"
#include <algorithm>

static inline CharClass class_at(std::string_view line, size_t i, const CharClassifier& cls) {
  return cls.classify(static_cast<unsigned char>(line[i]));
}

std::vector<int> word_starts(std::string_view line, const CharClassifier& cls) {
  std::vector<int> out;
  if (line.empty()) { out.push_back(0); return out; }
  for (size_t i = 0; i < line.size(); ++i) {
    CharClass c = class_at(line, i, cls);
    if (c == CharClass::Space) continue;
    if (i == 0 || class_at(line, i - 1, cls) != c) out.push_back(static_cast<int>(i));
  }
  return out;
}

std::vector<int> word_ends(std::string_view line, const CharClassifier& cls) {
  std::vector<int> out;
  for (size_t i = 0; i < line.size(); ++i) {
    CharClass c = class_at(line, i, cls);
    if (c == CharClass::Space) continue;
    if (i + 1 == line.size() || class_at(line, i + 1, cls) != c) out.push_back(static_cast<int>(i));
  }
  return out;
}

Position Position::get_left() const {
  return Position(line_, std::max(0, character_ - 1));
}

Position Position::get_right(const IDocument& doc) const {
  int len = doc.line_length(line_);
  return Position(line_, std::min(character_ + 1, len));
}

Position Position::get_line_end(const IDocument& doc) const {
  return Position(line_, doc.line_length(line_));
}

Position Position::get_first_line_non_blank_char(const IDocument& doc, const CharClassifier& cls) const {
  const std::string& line = doc.line_text(line_);
  size_t i = 0;
  while (i < line.size() && cls.is_space(static_cast<unsigned char>(line[i]))) i++;
  return Position(line_, static_cast<int>(i));
}

bool Position::is_line_end(const IDocument& doc) const {
  return character_ >= doc.line_length(line_);
}

Position Position::get_word_left(const IDocument& doc, bool inclusive, const CharClassifier& cls) const {
  for (int row = line_; row >= 0; --row) {
    std::vector<int> starts = word_starts(doc.line_text(row), cls);
    for (auto it = starts.rbegin(); it != starts.rend(); ++it) {
      if (row != line_ || *it < character_ || (inclusive && *it == character_)) return Position(row, *it);
    }
  }
  return Position(0, 0);
}

Position Position::get_word_right(const IDocument& doc, bool inclusive, const CharClassifier& cls) const {
  int n = doc.line_count();
  for (int row = line_; row < n; ++row) {
    std::vector<int> starts = word_starts(doc.line_text(row), cls);
    for (int s : starts) {
      if (row != line_ || s > character_ || (inclusive && s == character_)) return Position(row, s);
    }
  }
  return Position(n - 1, 0).get_line_end(doc);
}

Position Position::get_current_word_end(const IDocument& doc, bool inclusive, const CharClassifier& cls) const {
  int n = doc.line_count();
  for (int row = line_; row < n; ++row) {
    std::vector<int> ends = word_ends(doc.line_text(row), cls);
    for (int e : ends) {
      if (row != line_ || e > character_ || (inclusive && e == character_)) return Position(row, e);
    }
  }
  return Position(n - 1, 0).get_line_end(doc);
}
