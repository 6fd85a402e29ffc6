#pragma once
/*
 * TextEditor
 *
 * Purpose: editor-command facade over one document snapshot and the options.
 * Design: no ambient "active editor"; the caller passes the snapshot and
 *         re-creates the facade (or the snapshot) after every edit.
 * Lifetime: holds references to the document and the options; both must
 *           outlive the facade, so temporaries are rejected at compile time.
 *           Options (tabstop, expandtab, wordchars) are re-read on every call.
 * Errors: rows outside the document throw std::out_of_range.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "document.hpp"
#include "options.hpp"
#include "position.hpp"
#include "text_edit.hpp"

class TextEditor {
public:
  TextEditor(const IDocument& doc, const EditorOptions& opts);
  TextEditor(IDocument&&, const EditorOptions&) = delete;
  TextEditor(const IDocument&, EditorOptions&&) = delete;
  TextEditor(IDocument&&, EditorOptions&&) = delete;

  std::optional<std::string> get_word(Position pos) const;
  std::optional<Range> get_word_range(Position pos) const;

  int measure_indent_column(std::string_view line) const;
  std::string set_indent_column(std::string_view line, int target_column) const;

  Position offset_to_position(size_t offset) const;
  size_t position_to_offset(Position pos) const;

  bool is_first_line(Position pos) const { return pos.line() == 0; }
  bool is_last_line(Position pos) const { return pos.line() == doc_.line_count() - 1; }

  int get_line_count() const { return doc_.line_count(); }
  const std::string& read_line_at(int row) const { return doc_.line_text(row); }
  int get_line_max_column(int row) const;
  std::optional<char> get_char_at(Position pos) const;
  std::string get_text() const;
  std::string get_text(Range range) const;

  // Replace edits re-indenting rows [first_row, last_row] by delta_columns
  std::vector<TextEdit> shift_lines_edits(int first_row, int last_row, int delta_columns) const;

private:
  const IDocument& doc_;
  const EditorOptions& opts_;
};
