#include "char_class.hpp"
#include <cctype>

AsciiCharClassifier::AsciiCharClassifier(std::string_view extra_word_chars) {
  for (char ch : extra_word_chars) extra_.set(static_cast<unsigned char>(ch));
}

CharClass AsciiCharClassifier::classify(unsigned char c) const {
  if (extra_.test(c)) return CharClass::Word;
  if (c >= 0x80) return CharClass::Word;
  if (std::isspace(c) != 0) return CharClass::Space;
  if (std::isalnum(c) != 0 || c == '_') return CharClass::Word;
  return CharClass::Punct;
}

const CharClassifier& default_classifier() {
  static const AsciiCharClassifier cls{};
  return cls;
}

bool is_blank(std::string_view text, const CharClassifier& cls) {
  for (char ch : text) {
    if (!cls.is_space(static_cast<unsigned char>(ch))) return false;
  }
  return true;
}
