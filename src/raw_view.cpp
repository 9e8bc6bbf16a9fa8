#include "stencil/raw_view.hpp"

#include <algorithm>
#include <utility>

#include "stencil/observability.hpp"

namespace stencil {

RawStenciledView::RawStenciledView(std::shared_ptr<const StencilTable> table,
                                   std::shared_ptr<std::mutex> guard)
    : table_(std::move(table)), guard_(std::move(guard)) {
  if (!table_) raise_error(ErrorCode::invalid_stencil, "view created without a stencil table");
}

int64_t RawStenciledView::seek(int64_t delta, Whence whence) {
  int64_t base = 0;
  switch (whence) {
    case Whence::set: base = 0; break;
    case Whence::cur: base = cursor_; break;
    case Whence::end: base = table_->total_size(); break;
  }
  int64_t target = 0;
  if (__builtin_add_overflow(base, delta, &target)) {
    raise_error(ErrorCode::invalid_seek,
                "seek by " + std::to_string(delta) + " from " + std::to_string(base) +
                    " overflows the file offset");
  }
  if (target < 0) {
    raise_error(ErrorCode::invalid_seek,
                "seek to " + std::to_string(target) + " is before the start of the file");
  }
  cursor_ = target;
  global_io_stats().record_seek();
  return cursor_;
}

std::string RawStenciledView::read(int64_t max_bytes) {
  const std::size_t i = table_->lookup(cursor_);
  if (i == StencilTable::npos) {
    global_io_stats().record_eof_read();
    return {};
  }
  // One call never crosses a stencil boundary, so never allocate past it.
  const int64_t left_in_stencil = table_->cumsizes()[i + 1] - cursor_;
  const bool clipped = max_bytes < 0 || max_bytes > left_in_stencil;
  const int64_t want = clipped ? left_in_stencil : max_bytes;
  if (want == 0) return {};
  std::string out(static_cast<std::size_t>(want), '\0');
  out.resize(read_stencil(i, out.data(), out.size(), clipped));
  return out;
}

std::size_t RawStenciledView::read_into(char* buf, std::size_t n) {
  const std::size_t i = table_->lookup(cursor_);
  if (i == StencilTable::npos) {
    global_io_stats().record_eof_read();
    return 0;
  }
  if (n == 0) return 0;
  const auto left_in_stencil = static_cast<uint64_t>(table_->cumsizes()[i + 1] - cursor_);
  const auto want = static_cast<std::size_t>(std::min<uint64_t>(n, left_in_stencil));
  return read_stencil(i, buf, want, want < n);
}

std::size_t RawStenciledView::read_stencil(std::size_t i, char* buf, std::size_t want,
                                           bool clipped) {
  IoStats& stats = global_io_stats();
  const Stencil& s = (*table_)[i];
  const int64_t offset_in_stencil = cursor_ - table_->cumsizes()[i];

  std::size_t got = 0;
  uint64_t read_ns = 0;
  bool source_closed = false;
  {
    std::unique_lock<std::mutex> lk;
    if (guard_) {
      lk = std::unique_lock<std::mutex>(*guard_);
      stats.record_guarded_read();
    }
    source_closed = s.source->closed();
    if (!source_closed) {
      s.source->seek(s.offset + offset_in_stencil, Whence::set);
      ScopeTimer timer(read_ns);
      got = s.source->read(buf, want);
    }
  }
  // Raised outside the guard: the event hook may read through a sibling view.
  if (source_closed) {
    raise_error(ErrorCode::closed_source,
                "stencil " + std::to_string(i) + " reads from closed " + s.source->describe());
  }

  cursor_ += static_cast<int64_t>(got);
  stats.read_latency.record(read_ns);
  stats.record_read(got, clipped);
  return got;
}

bool RawStenciledView::seekable() const {
  const auto& sources = table_->sources();
  return std::all_of(sources.begin(), sources.end(),
                     [](const std::shared_ptr<Source>& s) { return s->seekable(); });
}

int RawStenciledView::fileno() const {
  raise_error(ErrorCode::unsupported_operation, "stenciled view has no file descriptor");
}

std::size_t RawStenciledView::write(std::string_view /*data*/) {
  raise_error(ErrorCode::unsupported_operation, "stenciled view is read-only");
}

int64_t RawStenciledView::truncate(int64_t /*size*/) {
  raise_error(ErrorCode::unsupported_operation, "stenciled view is read-only");
}

}  // namespace stencil
