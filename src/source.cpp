#include "stencil/source.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace stencil {

namespace {

int to_posix_whence(Whence whence) {
  switch (whence) {
    case Whence::set: return SEEK_SET;
    case Whence::cur: return SEEK_CUR;
    case Whence::end: return SEEK_END;
  }
  return SEEK_SET;
}

}  // namespace

// ---------------------------------------------------------------------------
// FileSource
// ---------------------------------------------------------------------------

FileSource::FileSource(std::string path) : path_(std::move(path)) {
  fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    raise_error(ErrorCode::io_error,
                "cannot open " + path_ + ": " + std::strerror(errno));
  }
  struct stat st {};
  seekable_ = ::fstat(fd_, &st) == 0 && S_ISREG(st.st_mode);
}

FileSource::~FileSource() {
  if (fd_ >= 0) ::close(fd_);
}

void FileSource::close() {
  if (fd_ < 0) return;
  const int rc = ::close(fd_);
  fd_ = -1;
  if (rc != 0) {
    raise_error(ErrorCode::io_error,
                "close failed for " + path_ + ": " + std::strerror(errno));
  }
}

int64_t FileSource::seek(int64_t offset, Whence whence) {
  if (closed()) raise_error(ErrorCode::closed_source, "seek on closed " + describe());
  if (!seekable_) raise_error(ErrorCode::unsupported_operation, describe() + " is not seekable");
  const off_t pos = ::lseek(fd_, static_cast<off_t>(offset), to_posix_whence(whence));
  if (pos < 0) {
    raise_error(ErrorCode::io_error,
                "seek failed for " + path_ + ": " + std::strerror(errno));
  }
  return static_cast<int64_t>(pos);
}

std::size_t FileSource::read(char* buf, std::size_t n) {
  if (closed()) raise_error(ErrorCode::closed_source, "read on closed " + describe());
  for (;;) {
    const ssize_t got = ::read(fd_, buf, n);
    if (got >= 0) return static_cast<std::size_t>(got);
    if (errno == EINTR) continue;
    raise_error(ErrorCode::io_error,
                "read failed for " + path_ + ": " + std::strerror(errno));
  }
}

int64_t FileSource::tell() const {
  if (closed()) return -1;
  return static_cast<int64_t>(::lseek(fd_, 0, SEEK_CUR));
}

// ---------------------------------------------------------------------------
// MemorySource
// ---------------------------------------------------------------------------

MemorySource::MemorySource(std::string data, bool seekable, bool readable)
    : data_(std::move(data)), seekable_(seekable), readable_(readable) {}

int64_t MemorySource::seek(int64_t offset, Whence whence) {
  if (closed_) raise_error(ErrorCode::closed_source, "seek on closed " + describe());
  if (!seekable_) raise_error(ErrorCode::unsupported_operation, describe() + " is not seekable");
  int64_t base = 0;
  if (whence == Whence::cur) base = pos_;
  else if (whence == Whence::end) base = static_cast<int64_t>(data_.size());
  int64_t target = 0;
  if (__builtin_add_overflow(base, offset, &target)) {
    raise_error(ErrorCode::invalid_seek, "seek offset overflows on " + describe());
  }
  if (target < 0) {
    raise_error(ErrorCode::invalid_seek, "negative seek on " + describe());
  }
  pos_ = target;
  return pos_;
}

std::size_t MemorySource::read(char* buf, std::size_t n) {
  if (closed_) raise_error(ErrorCode::closed_source, "read on closed " + describe());
  if (!readable_) raise_error(ErrorCode::not_readable, describe() + " is not readable");
  const auto size = static_cast<int64_t>(data_.size());
  if (pos_ >= size) return 0;
  const std::size_t count = std::min(n, static_cast<std::size_t>(size - pos_));
  std::memcpy(buf, data_.data() + pos_, count);
  pos_ += static_cast<int64_t>(count);
  return count;
}

std::string MemorySource::describe() const {
  return "memory:" + std::to_string(data_.size()) + "B";
}

}  // namespace stencil
