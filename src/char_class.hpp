#pragma once
/*
 * CharClassifier
 *
 * Purpose: map one byte of line text to Space/Word/Punct.
 * Goal: word motions, word lookup and indent scanning share one predicate;
 *       swap the implementation for locale/Unicode aware classification.
 */
#include <bitset>
#include <string_view>
#include "types.hpp"

class CharClassifier {
public:
  virtual ~CharClassifier() = default;
  virtual CharClass classify(unsigned char c) const = 0;

  bool is_space(unsigned char c) const { return classify(c) == CharClass::Space; }
  bool is_word(unsigned char c) const { return classify(c) == CharClass::Word; }
};

/*
 * ASCII rules; bytes >= 0x80 count as word bytes so UTF-8 sequences stay
 * inside one word. extra_word_chars adds bytes to the Word class.
 */
class AsciiCharClassifier : public CharClassifier {
public:
  AsciiCharClassifier() = default;
  explicit AsciiCharClassifier(std::string_view extra_word_chars);
  CharClass classify(unsigned char c) const override;

private:
  std::bitset<256> extra_;
};

const CharClassifier& default_classifier();

bool is_blank(std::string_view text, const CharClassifier& cls);
