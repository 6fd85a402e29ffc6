#pragma once
/*
 * TextEdit / IEditTarget
 *
 * Purpose: capability interface through which a host applies edits.
 * Note: the coordinate/indent core only produces edits, it never applies them.
 */
#include <string>
#include "position.hpp"

struct TextEdit {
  enum class Kind { Insert, Delete, Replace } kind = Kind::Insert;
  Range range;
  std::string text;

  static TextEdit insert(Position at, std::string text) { return {Kind::Insert, Range(at, at), std::move(text)}; }
  static TextEdit erase(Range r) { return {Kind::Delete, r, std::string()}; }
  static TextEdit replace(Range r, std::string text) { return {Kind::Replace, r, std::move(text)}; }
};

class IEditTarget {
public:
  virtual ~IEditTarget() = default;
  virtual bool apply(const TextEdit& edit, std::string& msg) = 0;
};
