#include "text_editor.hpp"
#include "text_buffer.hpp"
#include <cassert>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// the facade keeps references: temporaries must not bind
static_assert(std::is_constructible_v<TextEditor, const TextSnapshot&, const EditorOptions&>);
static_assert(std::is_constructible_v<TextEditor, TextSnapshot&, EditorOptions&>);
static_assert(!std::is_constructible_v<TextEditor, TextSnapshot, const EditorOptions&>);
static_assert(!std::is_constructible_v<TextEditor, const TextSnapshot&, EditorOptions>);
static_assert(!std::is_constructible_v<TextEditor, TextSnapshot, EditorOptions>);

static void test_queries() {
  TextSnapshot doc = TextSnapshot::from_text("int main() {\r\n\treturn 0;\n}");
  EditorOptions opts;
  TextEditor ed(doc, opts);
  assert(ed.get_line_count() == 3);
  assert(ed.is_first_line(Position(0, 5)));
  assert(!ed.is_first_line(Position(1, 0)));
  assert(ed.is_last_line(Position(2, 0)));
  assert(!ed.is_last_line(Position(1, 0)));
  assert(ed.read_line_at(1) == "\treturn 0;");
  assert(ed.get_line_max_column(0) == 12);
  assert(ed.get_char_at(Position(0, 4)) == 'm');
  assert(!ed.get_char_at(Position(0, 12)));
  assert(ed.get_word(Position(0, 5)) == std::string("main"));
  assert(ed.get_word(Position(1, 0)) == std::string("return"));
  assert(ed.get_word(Position(0, 8)) == std::string("()"));
  assert(!ed.get_word(Position(2, 1)));

  bool thrown = false;
  try { (void)ed.read_line_at(3); } catch (const std::out_of_range&) { thrown = true; }
  assert(thrown);
  thrown = false;
  try { (void)ed.get_line_max_column(-1); } catch (const std::out_of_range&) { thrown = true; }
  assert(thrown);
}

static void test_text_and_offsets() {
  TextSnapshot doc = TextSnapshot::from_text("int main() {\r\n\treturn 0;\n}");
  EditorOptions opts;
  TextEditor ed(doc, opts);
  assert(ed.get_text() == doc.text());
  assert(ed.get_text(Range(Position(0, 4), Position(1, 7))) == "main() {\r\n\treturn");
  assert(ed.get_text(Range(Position(1, 7), Position(1, 7))).empty());
  assert(ed.position_to_offset(Position(1, 1)) == 15);
  assert(ed.offset_to_position(15) == Position(1, 1));
  assert(ed.offset_to_position(ed.position_to_offset(Position(2, 1))) == Position(2, 1));
}

static void test_indent_uses_options() {
  TextSnapshot doc = TextSnapshot::from_text("\t\tfoo");
  EditorOptions opts;
  opts.tabstop = 4;
  opts.expandtab = false;
  TextEditor ed(doc, opts);
  assert(ed.measure_indent_column(doc.line_text(0)) == 8);
  assert(ed.set_indent_column(doc.line_text(0), 5) == "\t foo");
  opts.tabstop = 2;
  assert(ed.measure_indent_column(doc.line_text(0)) == 4);
  opts.expandtab = true;
  assert(ed.set_indent_column(doc.line_text(0), 3) == "   foo");
  assert(ed.set_indent_column("x", -2) == "x");
}

static void test_shift_edits_apply() {
  TextBuffer buf(TextSnapshot::from_text("if (x) {\nfoo();\n\n  bar();\n}"));
  EditorOptions opts;
  opts.tabstop = 4;
  opts.expandtab = true;
  std::vector<TextEdit> edits;
  {
    TextEditor ed(buf.snapshot(), opts);
    edits = ed.shift_lines_edits(3, 1, 4);
  }
  // blank line untouched
  assert(edits.size() == 2);
  std::string msg;
  for (const auto& e : edits) assert(buf.apply(e, msg));
  assert(buf.snapshot().text() == "if (x) {\n    foo();\n\n      bar();\n}");

  TextEditor ed(buf.snapshot(), opts);
  auto back = ed.shift_lines_edits(0, 4, -4);
  assert(back.size() == 2);
  for (const auto& e : back) assert(buf.apply(e, msg));
  assert(buf.snapshot().text() == "if (x) {\nfoo();\n\n  bar();\n}");
}

static void test_wordchars_option() {
  TextSnapshot doc = TextSnapshot::from_text("margin-left: 0");
  EditorOptions opts;
  TextEditor plain(doc, opts);
  assert(plain.get_word(Position(0, 1)) == std::string("margin"));
  opts.wordchars = "-";
  TextEditor css(doc, opts);
  assert(css.get_word(Position(0, 1)) == std::string("margin-left"));
  // an existing facade follows later option changes
  assert(plain.get_word(Position(0, 1)) == std::string("margin-left"));
  std::string msg;
  OptionSet set(opts);
  assert(set.execute("set wordchars=", msg));
  assert(css.get_word(Position(0, 1)) == std::string("margin"));
}

int main() {
  test_queries();
  test_text_and_offsets();
  test_indent_uses_options();
  test_shift_edits_apply();
  test_wordchars_option();
  return 0;
}
