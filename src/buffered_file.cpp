#include "stencil/buffered_file.hpp"

#include <algorithm>
#include <cstring>
#include <string>

#include "stencil/config.hpp"

namespace stencil {

namespace {

std::size_t effective_buffer_size(std::size_t requested) {
  return requested ? requested : global_config().buffer_size;
}

}  // namespace

// ---------------------------------------------------------------------------
// StenciledStreambuf
// ---------------------------------------------------------------------------

StenciledStreambuf::StenciledStreambuf(RawStenciledView& raw, std::size_t buffer_size)
    : raw_(raw), buffer_(std::max<std::size_t>(buffer_size, 1)) {
  setg(buffer_.data(), buffer_.data(), buffer_.data());
}

int64_t StenciledStreambuf::position() const {
  return raw_.tell() - static_cast<int64_t>(egptr() - gptr());
}

StenciledStreambuf::int_type StenciledStreambuf::underflow() {
  if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
  const std::size_t got = raw_.read_into(buffer_.data(), buffer_.size());
  setg(buffer_.data(), buffer_.data(), buffer_.data() + got);
  if (got == 0) return traits_type::eof();
  return traits_type::to_int_type(*gptr());
}

std::streamsize StenciledStreambuf::xsgetn(char_type* s, std::streamsize n) {
  std::streamsize done = 0;
  while (done < n) {
    const std::streamsize avail = egptr() - gptr();
    if (avail > 0) {
      const std::streamsize take = std::min(avail, n - done);
      std::memcpy(s + done, gptr(), static_cast<std::size_t>(take));
      gbump(static_cast<int>(take));
      done += take;
      continue;
    }
    // Large requests go straight to the raw view instead of through the buffer.
    // The drained get area no longer sits just behind the raw cursor, so it is
    // dropped to keep seek_to from treating it as the current window.
    if (n - done >= static_cast<std::streamsize>(buffer_.size())) {
      setg(buffer_.data(), buffer_.data(), buffer_.data());
      const std::size_t got = raw_.read_into(s + done, static_cast<std::size_t>(n - done));
      if (got == 0) break;
      done += static_cast<std::streamsize>(got);
      continue;
    }
    if (traits_type::eq_int_type(underflow(), traits_type::eof())) break;
  }
  return done;
}

std::streamsize StenciledStreambuf::showmanyc() {
  const std::streamsize buffered = egptr() - gptr();
  const int64_t beyond = raw_.size() - raw_.tell();
  if (buffered == 0 && beyond <= 0) return -1;
  return buffered + static_cast<std::streamsize>(std::max<int64_t>(beyond, 0));
}

int64_t StenciledStreambuf::seek_to(int64_t delta, Whence whence) {
  int64_t base = 0;
  if (whence == Whence::cur) base = position();
  else if (whence == Whence::end) base = raw_.size();
  int64_t target = 0;
  if (__builtin_add_overflow(base, delta, &target)) {
    raise_error(ErrorCode::invalid_seek,
                "seek by " + std::to_string(delta) + " from " + std::to_string(base) +
                    " overflows the file offset");
  }

  // Stay inside the buffered window when possible; the window covers
  // [raw cursor - (egptr - eback), raw cursor].
  const int64_t window_end = raw_.tell();
  const int64_t window_begin = window_end - static_cast<int64_t>(egptr() - eback());
  if (target >= window_begin && target <= window_end && egptr() != eback()) {
    setg(eback(), eback() + (target - window_begin), egptr());
    return target;
  }

  raw_.seek(target, Whence::set);
  setg(buffer_.data(), buffer_.data(), buffer_.data());
  return target;
}

std::string StenciledStreambuf::peek(std::size_t n) {
  if (gptr() == egptr()) underflow();
  const auto avail = static_cast<std::size_t>(egptr() - gptr());
  return std::string(gptr(), std::min(n, avail));
}

StenciledStreambuf::pos_type StenciledStreambuf::seekoff(off_type off,
                                                         std::ios_base::seekdir dir,
                                                         std::ios_base::openmode which) {
  if (!(which & std::ios_base::in)) return pos_type(off_type(-1));
  Whence whence = Whence::set;
  if (dir == std::ios_base::cur) whence = Whence::cur;
  else if (dir == std::ios_base::end) whence = Whence::end;
  try {
    return pos_type(off_type(seek_to(static_cast<int64_t>(off), whence)));
  } catch (const StencilError& e) {
    // streambuf reports a rejected seek as -1; the failure is already counted.
    if (e.code() != ErrorCode::invalid_seek) throw;
    return pos_type(off_type(-1));
  }
}

StenciledStreambuf::pos_type StenciledStreambuf::seekpos(pos_type pos,
                                                         std::ios_base::openmode which) {
  return seekoff(off_type(pos), std::ios_base::beg, which);
}

// ---------------------------------------------------------------------------
// BufferedStenciledFile
// ---------------------------------------------------------------------------

BufferedStenciledFile::BufferedStenciledFile(std::shared_ptr<const StencilTable> table,
                                             std::shared_ptr<std::mutex> guard,
                                             std::size_t buffer_size)
    : raw_(std::move(table), std::move(guard)),
      buf_(raw_, effective_buffer_size(buffer_size)),
      stream_(&buf_) {}

std::string BufferedStenciledFile::read(int64_t n) {
  const int64_t remaining = std::max<int64_t>(size() - tell(), 0);
  const int64_t want = (n < 0) ? remaining : std::min(n, remaining);

  // Grow with the data actually delivered; a stencil may promise more bytes
  // than its source holds.
  std::string out;
  auto chunk = static_cast<int64_t>(std::max<std::size_t>(buffer_size(), kDefaultBufferSize));
  while (static_cast<int64_t>(out.size()) < want) {
    const std::size_t old = out.size();
    const auto step = static_cast<std::size_t>(std::min(want - static_cast<int64_t>(old), chunk));
    out.resize(old + step);
    const std::size_t got = read_into(out.data() + old, step);
    out.resize(old + got);
    if (got < step) break;
    chunk *= 2;
  }
  return out;
}

std::size_t BufferedStenciledFile::read_into(char* buf, std::size_t n) {
  return static_cast<std::size_t>(buf_.sgetn(buf, static_cast<std::streamsize>(n)));
}

int64_t BufferedStenciledFile::seek(int64_t delta, Whence whence) {
  return buf_.seek_to(delta, whence);
}

}  // namespace stencil
