#include "file_reader.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <thread>
#include <future>
#include <algorithm>
#include "posix_fd.hpp"

namespace {

struct LineRange { size_t start; size_t end; unsigned char eol; };

void ranges_from_newlines(const char* data, size_t n, const std::vector<size_t>& nl,
                          std::vector<LineRange>& ranges) {
  ranges.reserve(nl.size() + 1);
  size_t start = 0;
  for (size_t pos : nl) {
    size_t end = pos;
    unsigned char eol = 1;
    if (end > start && data[end - 1] == '\r') { end--; eol = 2; }
    ranges.push_back({start, end, eol});
    start = pos + 1;
  }
  ranges.push_back({start, n, 0});
}

}

void split_lines(const char* data, size_t n,
                 std::vector<std::string>& out_lines,
                 std::vector<unsigned char>& out_eols) {
  out_lines.clear();
  out_eols.clear();
  std::vector<size_t> nl;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') nl.push_back(i);
  }
  std::vector<LineRange> ranges;
  ranges_from_newlines(data, n, nl, ranges);
  out_lines.reserve(ranges.size());
  out_eols.reserve(ranges.size());
  for (const auto& r : ranges) {
    out_lines.emplace_back(data + r.start, r.end - r.start);
    out_eols.push_back(r.eol);
  }
}

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::vector<unsigned char>& out_eols,
                     std::string& msg) {
  out_lines.clear();
  out_eols.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out_lines.emplace_back("");
    out_eols.push_back(0);
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  MappedRegion region(fd.get(), n);
  if (!region.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = region.data();
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  const size_t min_parallel_size = 1 << 20;
  if (n < min_parallel_size || hw == 1) {
    split_lines(data, n, out_lines, out_eols);
    msg = std::string("opened file: ") + path.string();
    return true;
  }

  unsigned threads = std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size));
  threads = std::max(threads, 2u);
  std::vector<std::vector<size_t>> newline_pos(threads);
  std::vector<std::future<void>> futs;
  size_t chunk = n / threads;
  for (unsigned t = 0; t < threads; ++t) {
    size_t s = t * chunk;
    size_t e = (t + 1 == threads) ? n : (t + 1) * chunk;
    futs.emplace_back(std::async(std::launch::async, [&, s, e, t]{
      auto& vec = newline_pos[t];
      vec.reserve((e - s) / 64 + 1);
      for (size_t i = s; i < e; ++i) {
        if (data[i] == '\n') vec.push_back(i);
      }
    }));
  }
  for (auto& f : futs) f.get();
  size_t total_nl = 0;
  for (const auto& v : newline_pos) total_nl += v.size();
  std::vector<size_t> nl;
  nl.reserve(total_nl);
  for (const auto& v : newline_pos) nl.insert(nl.end(), v.begin(), v.end());

  std::vector<LineRange> ranges;
  ranges_from_newlines(data, n, nl, ranges);
  out_lines.resize(ranges.size());
  out_eols.resize(ranges.size());
  unsigned tcopy = std::min<unsigned>(hw, static_cast<unsigned>(ranges.size()));
  auto copy_range = [&](size_t i0, size_t i1) {
    for (size_t i = i0; i < i1; ++i) {
      out_lines[i].assign(data + ranges[i].start, ranges[i].end - ranges[i].start);
      out_eols[i] = ranges[i].eol;
    }
  };
  if (tcopy <= 1 || ranges.size() < 1024) {
    copy_range(0, ranges.size());
  } else {
    size_t per = (ranges.size() + tcopy - 1) / tcopy;
    std::vector<std::future<void>> f2;
    for (unsigned t = 0; t < tcopy; ++t) {
      size_t i0 = t * per;
      size_t i1 = std::min(ranges.size(), (t + 1) * per);
      if (i0 >= i1) break;
      f2.emplace_back(std::async(std::launch::async, copy_range, i0, i1));
    }
    for (auto& f : f2) f.get();
  }
  msg = std::string("opened file: ") + path.string();
  return true;
}
