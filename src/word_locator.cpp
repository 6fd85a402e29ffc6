#include "word_locator.hpp"
#include <algorithm>
#include <vector>

std::optional<Range> get_word_range(const IDocument& doc, Position pos, const CharClassifier& cls) {
  const std::string& line = doc.line_text(pos.line());
  int len = static_cast<int>(line.size());
  Position cur(pos.line(), std::min(pos.character(), len));

  Position right = cur.get_right(doc);
  std::string_view probe(line.data() + cur.character(),
                         static_cast<size_t>(right.character() - cur.character()));
  Position start = is_blank(probe, cls) ? cur.get_word_right(doc, false, cls)
                                        : cur.get_word_left(doc, true, cls);
  if (start.line() != cur.line()) return std::nullopt;

  Position end = start.get_current_word_end(doc, true, cls).get_right(doc);
  if (end.line() != start.line()) end = start.get_line_end(doc);
  if (end.character() <= start.character()) return std::nullopt;

  std::string_view word(line.data() + start.character(),
                        static_cast<size_t>(end.character() - start.character()));
  if (is_blank(word, cls)) return std::nullopt;
  return Range(start, end);
}

std::optional<std::string> get_word(const IDocument& doc, Position pos, const CharClassifier& cls) {
  auto r = get_word_range(doc, pos, cls);
  if (!r) return std::nullopt;
  const std::string& line = doc.line_text(r->start.line());
  return line.substr(static_cast<size_t>(r->start.character()),
                     static_cast<size_t>(r->end.character() - r->start.character()));
}

std::optional<std::string> get_word(Position pos, std::string_view line_text, const CharClassifier& cls) {
  TextSnapshot one(std::vector<std::string>{std::string(line_text)});
  return get_word(one, Position(0, pos.character()), cls);
}
