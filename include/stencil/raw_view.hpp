#pragma once

// stencil/raw_view.hpp - Unbuffered random-access reader over a StencilTable.
//
// READ CONTRACT:
//   read() serves bytes from exactly one stencil per call: one seek and one
//   read on that stencil's source. A request that spans a stencil boundary
//   returns short; callers loop until satisfied or until read() returns empty,
//   which happens only at or past the end of the virtual file.
//   BufferedStenciledFile does this looping for you.
//
// CURSOR:
//   seek() rejects negative results (cursor unchanged) but does not clamp at
//   the end: a cursor past total size is valid and reads there return empty.
//
// CONCURRENCY:
//   A view is single-threaded. Several views (or duplicate stencils) may share
//   one Source; pass the same guard to every such view to keep each
//   seek+read pair atomic with respect to the others. Without a guard,
//   concurrent use of a shared source is unspecified.
//
// OWNERSHIP:
//   close() marks the view closed and nothing else. Sources are never closed
//   by the view.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "stencil/stencil_table.hpp"
#include "stencil/types.hpp"

namespace stencil {

class RawStenciledView {
 public:
  static constexpr int64_t kReadAll = -1;

  explicit RawStenciledView(std::shared_ptr<const StencilTable> table,
                            std::shared_ptr<std::mutex> guard = nullptr);

  int64_t seek(int64_t delta, Whence whence = Whence::set);
  int64_t tell() const { return cursor_; }

  // Negative max_bytes means "up to the end of the current stencil".
  std::string read(int64_t max_bytes = kReadAll);
  std::size_t read_into(char* buf, std::size_t n);

  bool readable() const { return true; }
  bool writable() const { return false; }
  bool seekable() const;

  void close() { closed_ = true; }
  bool closed() const { return closed_; }

  // No OS descriptor, no write path. These always throw unsupported_operation.
  [[noreturn]] int fileno() const;
  [[noreturn]] std::size_t write(std::string_view data);
  [[noreturn]] int64_t truncate(int64_t size);

  int64_t size() const { return table_->total_size(); }
  const StencilTable& table() const { return *table_; }
  const std::shared_ptr<const StencilTable>& shared_table() const { return table_; }
  const std::shared_ptr<std::mutex>& guard() const { return guard_; }

 private:
  // One source read of `want` bytes from stencil i at the cursor. `clipped`
  // marks a request the stencil boundary cut short.
  std::size_t read_stencil(std::size_t i, char* buf, std::size_t want, bool clipped);

  std::shared_ptr<const StencilTable> table_;
  std::shared_ptr<std::mutex> guard_;
  int64_t cursor_{0};
  bool closed_{false};
};

}  // namespace stencil
