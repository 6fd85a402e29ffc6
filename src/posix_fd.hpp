#pragma once
#include <cstddef>
#include <sys/mman.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

// read-only private mapping of a whole file; unmapped on destruction
class MappedRegion {
public:
  MappedRegion() = default;
  MappedRegion(int fd, size_t len) : len_(len) {
    void* p = ::mmap(nullptr, len, PROT_READ, MAP_PRIVATE, fd, 0);
    if (p != MAP_FAILED) addr_ = p; else len_ = 0;
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() { if (addr_) ::munmap(addr_, len_); }
  bool valid() const { return addr_ != nullptr; }
  const char* data() const { return static_cast<const char*>(addr_); }
  size_t size() const { return len_; }
private:
  void* addr_ = nullptr;
  size_t len_ = 0;
};
