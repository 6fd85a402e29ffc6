#include "document.hpp"
#include <stdexcept>
#include "file_reader.hpp"

TextSnapshot::TextSnapshot() {
  rebuild();
}

TextSnapshot::TextSnapshot(std::vector<std::string> lines, LineEnding eol)
    : lines_(std::move(lines)) {
  eols_.assign(lines_.size(), static_cast<unsigned char>(eol_width(eol)));
  rebuild();
}

TextSnapshot::TextSnapshot(std::vector<std::string> lines, std::vector<unsigned char> eol_widths)
    : lines_(std::move(lines)), eols_(std::move(eol_widths)) {
  rebuild();
}

void TextSnapshot::rebuild() {
  if (lines_.empty()) lines_.emplace_back();
  eols_.resize(lines_.size(), 1);
  for (size_t i = 0; i + 1 < eols_.size(); ++i) {
    if (eols_[i] != 1 && eols_[i] != 2) eols_[i] = 1;
  }
  eols_.back() = 0;
  index_.build(lines_, eols_);
}

TextSnapshot TextSnapshot::from_text(std::string_view text) {
  std::vector<std::string> ls;
  std::vector<unsigned char> eols;
  split_lines(text.data(), text.size(), ls, eols);
  return TextSnapshot(std::move(ls), std::move(eols));
}

TextSnapshot TextSnapshot::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  std::vector<std::string> ls;
  std::vector<unsigned char> eols;
  ok = mmap_read_lines(path, ls, eols, msg);
  if (!ok) return TextSnapshot();
  return TextSnapshot(std::move(ls), std::move(eols));
}

const std::string& TextSnapshot::line_text(int row) const {
  if (row < 0 || row >= line_count()) {
    throw std::out_of_range("line " + std::to_string(row) + " out of range [0, " +
                            std::to_string(line_count()) + ")");
  }
  return lines_[static_cast<size_t>(row)];
}

std::string_view TextSnapshot::line_ending(int row) const {
  if (row < 0 || row >= line_count()) return {};
  switch (eols_[static_cast<size_t>(row)]) {
    case 1: return "\n";
    case 2: return "\r\n";
    default: return {};
  }
}

std::string TextSnapshot::text() const {
  std::string out;
  out.reserve(index_.total_length());
  for (int r = 0; r < line_count(); ++r) {
    out += lines_[static_cast<size_t>(r)];
    out += line_ending(r);
  }
  return out;
}
