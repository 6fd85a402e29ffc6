#include "text_editor.hpp"
#include <algorithm>
#include <stdexcept>
#include "coord_mapper.hpp"
#include "indent_codec.hpp"
#include "word_locator.hpp"

TextEditor::TextEditor(const IDocument& doc, const EditorOptions& opts)
    : doc_(doc), opts_(opts) {}

std::optional<std::string> TextEditor::get_word(Position pos) const {
  return ::get_word(doc_, pos, opts_.classifier());
}

std::optional<Range> TextEditor::get_word_range(Position pos) const {
  return ::get_word_range(doc_, pos, opts_.classifier());
}

int TextEditor::measure_indent_column(std::string_view line) const {
  return ::measure_indent_column(line, opts_.tabstop, opts_.classifier());
}

std::string TextEditor::set_indent_column(std::string_view line, int target_column) const {
  return ::set_indent_column(line, target_column, opts_.tabstop, opts_.expandtab, opts_.classifier());
}

Position TextEditor::offset_to_position(size_t offset) const {
  return ::offset_to_position(offset, doc_.line_index());
}

size_t TextEditor::position_to_offset(Position pos) const {
  return ::position_to_offset(pos, doc_.line_index());
}

int TextEditor::get_line_max_column(int row) const {
  if (row < 0 || row >= doc_.line_count()) {
    throw std::out_of_range("illegal value " + std::to_string(row) + " for line");
  }
  return doc_.line_length(row);
}

std::optional<char> TextEditor::get_char_at(Position pos) const {
  const std::string& line = doc_.line_text(pos.line());
  if (static_cast<size_t>(pos.character()) >= line.size()) return std::nullopt;
  return line[static_cast<size_t>(pos.character())];
}

std::string TextEditor::get_text() const {
  return get_text(Range(Position(0, 0), Position(doc_.line_count() - 1, 0).get_line_end(doc_)));
}

std::string TextEditor::get_text(Range range) const {
  const LineIndex& li = doc_.line_index();
  Position s = range.start;
  Position e = range.end;
  std::string out;
  for (int row = s.line(); row <= e.line(); ++row) {
    const std::string& line = doc_.line_text(row);
    size_t c0 = (row == s.line()) ? std::min(static_cast<size_t>(s.character()), line.size()) : 0;
    size_t c1 = (row == e.line()) ? std::min(static_cast<size_t>(e.character()), line.size()) : line.size();
    if (c1 > c0) out.append(line, c0, c1 - c0);
    if (row != e.line()) out += (li.eol_width(static_cast<size_t>(row)) == 2) ? "\r\n" : "\n";
  }
  return out;
}

std::vector<TextEdit> TextEditor::shift_lines_edits(int first_row, int last_row, int delta_columns) const {
  std::vector<TextEdit> edits;
  AsciiCharClassifier cls = opts_.classifier();
  if (first_row > last_row) std::swap(first_row, last_row);
  for (int row = first_row; row <= last_row; ++row) {
    const std::string& line = doc_.line_text(row);
    if (line.empty()) continue;
    std::string neu = shift_indent_column(line, delta_columns, opts_.tabstop, opts_.expandtab, cls);
    if (neu == line) continue;
    edits.push_back(TextEdit::replace(Range(Position(row, 0), Position(row, static_cast<int>(line.size()))),
                                      std::move(neu)));
  }
  return edits;
}
