#pragma once
/*
 * IndentCodec
 *
 * Purpose: leading whitespace <-> visible column.
 * Rule: a tab is worth tab_width columns (flat, not "next tab stop"),
 *       a space one column, other whitespace nothing.
 * Precondition: tab_width > 0, else std::invalid_argument.
 */
#include <string>
#include <string_view>
#include "char_class.hpp"

// measurements saturate at INT_MAX
// negative measurements mean "indeterminate"; treat them as no indentation
constexpr int kIndeterminateIndent = -1;

size_t leading_whitespace_length(std::string_view line, const CharClassifier& cls = default_classifier());

int measure_indent_column(std::string_view line, int tab_width,
                          const CharClassifier& cls = default_classifier());

std::string make_indent(int target_column, int tab_width, bool expand_tabs);

std::string set_indent_column(std::string_view line, int target_column, int tab_width, bool expand_tabs,
                              const CharClassifier& cls = default_classifier());

// >> / << : move the indentation by delta_columns, never below column 0
std::string shift_indent_column(std::string_view line, int delta_columns, int tab_width, bool expand_tabs,
                                const CharClassifier& cls = default_classifier());
