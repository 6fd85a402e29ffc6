#include "indent_codec.hpp"
#include <algorithm>
#include <climits>
#include <stdexcept>

static int saturate(long long v) {
  return static_cast<int>(std::clamp<long long>(v, 0, INT_MAX));
}

static void require_tab_width(int tab_width) {
  if (tab_width <= 0) throw std::invalid_argument("tab width must be > 0, got " + std::to_string(tab_width));
}

size_t leading_whitespace_length(std::string_view line, const CharClassifier& cls) {
  size_t i = 0;
  while (i < line.size() && cls.is_space(static_cast<unsigned char>(line[i]))) i++;
  return i;
}

int measure_indent_column(std::string_view line, int tab_width, const CharClassifier& cls) {
  require_tab_width(tab_width);
  size_t n = leading_whitespace_length(line, cls);
  long long col = 0;
  for (size_t i = 0; i < n && col < INT_MAX; ++i) {
    switch (line[i]) {
      case '\t': col += tab_width; break;
      case ' ': col += 1; break;
      default: break;
    }
  }
  return saturate(col);
}

std::string make_indent(int target_column, int tab_width, bool expand_tabs) {
  require_tab_width(tab_width);
  if (target_column < 0) target_column = 0;
  if (expand_tabs) return std::string(static_cast<size_t>(target_column), ' ');
  std::string out(static_cast<size_t>(target_column / tab_width), '\t');
  out.append(static_cast<size_t>(target_column % tab_width), ' ');
  return out;
}

std::string set_indent_column(std::string_view line, int target_column, int tab_width, bool expand_tabs,
                              const CharClassifier& cls) {
  std::string out = make_indent(target_column, tab_width, expand_tabs);
  out.append(line.substr(leading_whitespace_length(line, cls)));
  return out;
}

std::string shift_indent_column(std::string_view line, int delta_columns, int tab_width, bool expand_tabs,
                                const CharClassifier& cls) {
  int cur = measure_indent_column(line, tab_width, cls);
  if (cur < 0) cur = 0;
  return set_indent_column(line, saturate(static_cast<long long>(cur) + delta_columns), tab_width, expand_tabs, cls);
}
