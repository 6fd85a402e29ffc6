#pragma once
/*
 * WordLocator
 *
 * Purpose: word under (or right after) a position.
 * Rule: on whitespace or at end of line take the next word, otherwise the
 *       word containing the position; the span never leaves the position's
 *       line, and std::nullopt means no word was found.
 */
#include <optional>
#include <string>
#include <string_view>
#include "char_class.hpp"
#include "document.hpp"
#include "position.hpp"

std::optional<Range> get_word_range(const IDocument& doc, Position pos,
                                    const CharClassifier& cls = default_classifier());

std::optional<std::string> get_word(const IDocument& doc, Position pos,
                                    const CharClassifier& cls = default_classifier());

// line_text is treated as a one-line document; only pos.character() is used
std::optional<std::string> get_word(Position pos, std::string_view line_text,
                                    const CharClassifier& cls = default_classifier());
