#include "text_buffer.hpp"
#include <cstddef>
#include <fcntl.h>
#include <unistd.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "config.hpp"

bool TextBuffer::in_range(Position p) const {
  if (p.line() >= snap_.line_count()) return false;
  return p.character() <= snap_.line_length(p.line());
}

bool TextBuffer::apply(const TextEdit& edit, std::string& msg) {
  const Range& r = edit.range;
  if (!in_range(r.start) || !in_range(r.end)) {
    msg = "edit out of range";
    return false;
  }
  std::string ins = (edit.kind == TextEdit::Kind::Delete) ? std::string() : edit.text;
  Position s = r.start;
  Position e = (edit.kind == TextEdit::Kind::Insert) ? r.start : r.end;
  if (s == e && ins.empty()) { msg.clear(); return true; }

  const auto& old_lines = snap_.lines();
  const auto& old_eols = snap_.eol_widths();
  size_t sl = static_cast<size_t>(s.line());
  size_t el = static_cast<size_t>(e.line());
  std::string prefix = old_lines[sl].substr(0, static_cast<size_t>(s.character()));
  std::string suffix = old_lines[el].substr(static_cast<size_t>(e.character()));
  unsigned char tail_eol = old_eols[el];

  std::vector<std::string> pieces;
  std::vector<unsigned char> piece_eols;
  split_lines(ins.data(), ins.size(), pieces, piece_eols);
  pieces.front().insert(0, prefix);
  pieces.back() += suffix;
  piece_eols.back() = tail_eol;

  std::vector<std::string> lines;
  std::vector<unsigned char> eols;
  lines.reserve(old_lines.size() - (el - sl + 1) + pieces.size());
  eols.reserve(lines.capacity());
  lines.insert(lines.end(), old_lines.begin(), old_lines.begin() + static_cast<std::ptrdiff_t>(sl));
  eols.insert(eols.end(), old_eols.begin(), old_eols.begin() + static_cast<std::ptrdiff_t>(sl));
  for (size_t i = 0; i < pieces.size(); ++i) {
    lines.push_back(std::move(pieces[i]));
    eols.push_back(piece_eols[i]);
  }
  lines.insert(lines.end(), old_lines.begin() + static_cast<std::ptrdiff_t>(el + 1), old_lines.end());
  eols.insert(eols.end(), old_eols.begin() + static_cast<std::ptrdiff_t>(el + 1), old_eols.end());

  snap_ = TextSnapshot(std::move(lines), std::move(eols));
  version_++;
  modified_ = true;
  msg.clear();
  return true;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  b.snap_ = TextSnapshot::from_file(path, msg, ok);
  if (ok) b.file_path_ = path;
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::error_code ec;
  auto fail = [&](const std::filesystem::path& p) {
    msg = std::string("write file failed: ") + p.string();
    ufd.reset();
    std::filesystem::remove(tmp, ec);
    return false;
  };
  std::string buf;
  buf.reserve(static_cast<size_t>(TC_WRITE_CHUNK_SIZE));
  auto flush_buf = [&]() -> bool {
    const char* p = buf.data();
    size_t remain = buf.size();
    while (remain > 0) {
      ssize_t w = ::write(ufd.get(), p, remain);
      if (w < 0) return false;
      p += w;
      remain -= static_cast<size_t>(w);
    }
    buf.clear();
    return true;
  };
  for (int i = 0; i < snap_.line_count(); ++i) {
    buf += snap_.line_text(i);
    buf += snap_.line_ending(i);
    if (buf.size() >= static_cast<size_t>(TC_WRITE_CHUNK_SIZE) && !flush_buf()) return fail(tmp);
  }
  if (!buf.empty() && !flush_buf()) return fail(tmp);
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail(tmp);
#else
  if (::fdatasync(ufd.get()) != 0) return fail(tmp);
#endif
  ufd.reset();
  std::filesystem::rename(tmp, path, ec);
  if (ec) return fail(path);
  file_path_ = path;
  modified_ = false;
  msg = std::string("saved file: ") + path.string();
  return true;
}
