#include "coord_mapper.hpp"
#include "document.hpp"
#include "line_index.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_mixed_endings() {
  TextSnapshot doc = TextSnapshot::from_text("a\nbc\r\ndef");
  const LineIndex& li = doc.line_index();
  assert(li.line_count() == 3);
  assert(li.total_length() == 9);
  assert(li.line_start(0) == 0);
  assert(li.line_start(1) == 2);
  assert(li.line_start(2) == 6);

  assert(offset_to_position(0, li) == Position(0, 0));
  assert(offset_to_position(1, li) == Position(0, 1));
  assert(offset_to_position(2, li) == Position(1, 0));
  assert(offset_to_position(4, li) == Position(1, 2));
  // between \r and \n
  assert(offset_to_position(5, li) == Position(1, 2));
  assert(offset_to_position(6, li) == Position(2, 0));
  assert(offset_to_position(9, li) == Position(2, 3));
  assert(offset_to_position(100, li) == Position(2, 3));

  assert(position_to_offset(Position(1, 1), li) == 3);
  assert(position_to_offset(Position(1, 5), li) == 4);
  assert(position_to_offset(Position(7, 0), li) == 6);
  assert(position_to_offset(Position(2, 3), li) == 9);
}

static void test_round_trip(const TextSnapshot& doc) {
  const LineIndex& li = doc.line_index();
  for (size_t o = 0; o <= li.total_length(); ++o) {
    Position p = offset_to_position(o, li);
    size_t back = position_to_offset(p, li);
    size_t row = static_cast<size_t>(p.line());
    bool inside_crlf = li.eol_width(row) == 2 && o == li.line_start(row) + li.line_length(row) + 1;
    if (!inside_crlf) assert(back == o);
  }
  for (int row = 0; row < doc.line_count(); ++row) {
    for (int ch = 0; ch <= doc.line_length(row); ++ch) {
      Position p(row, ch);
      assert(offset_to_position(position_to_offset(p, li), li) == p);
    }
  }
}

static void test_small_blocks() {
  std::vector<std::string> lines = {"ab", "", "c", "dddd", "", "e", "f"};
  std::vector<unsigned char> eols = {1, 2, 1, 1, 2, 1, 0};
  LineIndex li(2);
  li.build(lines, eols);
  assert(li.line_count() == 7);
  size_t off = 0;
  for (size_t r = 0; r < lines.size(); ++r) {
    assert(li.line_start(r) == off);
    assert(li.row_at_offset(off) == r);
    assert(offset_to_position(off, li) == Position(static_cast<int>(r), 0));
    off += lines[r].size() + eols[r];
  }
  assert(li.total_length() == off);
  assert(li.line_start(99) == li.total_length());
  assert(offset_to_position(4, li) == Position(1, 0));
  assert(position_to_offset(Position(3, 2), li) == 9);
}

static void test_empty() {
  TextSnapshot doc;
  assert(doc.line_count() == 1);
  assert(doc.total_length() == 0);
  assert(offset_to_position(0, doc.line_index()) == Position(0, 0));
  assert(offset_to_position(5, doc.line_index()) == Position(0, 0));
  assert(position_to_offset(Position(0, 3), doc.line_index()) == 0);
}

int main() {
  test_mixed_endings();
  test_round_trip(TextSnapshot::from_text("a\nbc\r\ndef"));
  test_round_trip(TextSnapshot::from_text("\n\n  x\n\r\nlast line\n"));
  test_round_trip(TextSnapshot(std::vector<std::string>{"one", "", "three"}, LineEnding::CRLF));
  test_small_blocks();
  test_empty();
  return 0;
}
