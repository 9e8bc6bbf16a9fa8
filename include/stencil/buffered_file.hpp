#pragma once

// stencil/buffered_file.hpp - Read-ahead wrapper with exact-size reads.
//
// BufferedStenciledFile owns a RawStenciledView and a std::streambuf whose get
// area is the read-ahead buffer. read(n) returns exactly n bytes unless the
// virtual file ends first: short raw reads at stencil boundaries and buffer
// refills are looped over internally.
//
// stream() exposes the same buffer as a std::istream for code written
// against iostreams. Errors reached through stream() follow iostream rules
// (badbit is set, nothing is thrown unless exceptions() asks for it); the
// direct member functions throw StencilError.

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>
#include <vector>

#include "stencil/raw_view.hpp"

namespace stencil {

class StenciledStreambuf : public std::streambuf {
 public:
  StenciledStreambuf(RawStenciledView& raw, std::size_t buffer_size);

  // Logical position: raw cursor minus bytes still buffered.
  int64_t position() const;

  // Throws StencilError(invalid_seek) on a negative target; position and
  // buffer are left unchanged in that case.
  int64_t seek_to(int64_t delta, Whence whence);

  // Up to n bytes at the current position without consuming them. Refills
  // the buffer when it is empty; never reads past one refill.
  std::string peek(std::size_t n);

  std::size_t capacity() const { return buffer_.size(); }

 protected:
  int_type underflow() override;
  std::streamsize xsgetn(char_type* s, std::streamsize n) override;
  std::streamsize showmanyc() override;
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which) override;
  pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

 private:
  RawStenciledView& raw_;
  std::vector<char> buffer_;
};

class BufferedStenciledFile {
 public:
  static constexpr int64_t kReadAll = -1;

  // buffer_size == 0 selects global_config().buffer_size.
  explicit BufferedStenciledFile(std::shared_ptr<const StencilTable> table,
                                 std::shared_ptr<std::mutex> guard = nullptr,
                                 std::size_t buffer_size = 0);
  virtual ~BufferedStenciledFile() = default;

  BufferedStenciledFile(const BufferedStenciledFile&) = delete;
  BufferedStenciledFile& operator=(const BufferedStenciledFile&) = delete;

  // Exactly n bytes, fewer only at the end of the virtual file. Negative n
  // reads everything that remains.
  std::string read(int64_t n = kReadAll);
  std::size_t read_into(char* buf, std::size_t n);
  std::string peek(std::size_t n = 1) { return buf_.peek(n); }

  int64_t seek(int64_t delta, Whence whence = Whence::set);
  int64_t tell() const { return buf_.position(); }

  bool readable() const { return raw_.readable(); }
  bool writable() const { return raw_.writable(); }
  bool seekable() const { return raw_.seekable(); }

  void close() { raw_.close(); }
  bool closed() const { return raw_.closed(); }
  int fileno() const { return raw_.fileno(); }

  int64_t size() const { return raw_.size(); }
  std::size_t buffer_size() const { return buf_.capacity(); }

  std::istream& stream() { return stream_; }
  RawStenciledView& raw() { return raw_; }
  const StencilTable& table() const { return raw_.table(); }

 private:
  RawStenciledView raw_;
  StenciledStreambuf buf_;
  std::istream stream_;
};

}  // namespace stencil
