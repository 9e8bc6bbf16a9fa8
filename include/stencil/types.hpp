#pragma once

// stencil/types.hpp - Core value types and error reporting for stenciled views.
//
// ERROR MODEL:
//   Every failure surfaces as a StencilError carrying an ErrorCode. Codes are
//   stable strings (to_string) so they can be written to the event log and
//   compared by callers without parsing messages.
//   No operation in this library retries internally.
//
// OFFSETS:
//   All offsets and lengths are signed 64-bit so that negative inputs can be
//   detected and rejected instead of silently wrapping.

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace stencil {

class Source;

enum class ErrorCode {
  none,
  invalid_stencil,
  not_readable,
  invalid_seek,
  closed_source,
  size_query_failed,
  unsupported_operation,
  io_error,
};

std::string to_string(ErrorCode code);

class StencilError : public std::runtime_error {
 public:
  StencilError(ErrorCode code, const std::string& message);

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Counts the failure in the global stats, emits an error event and throws.
[[noreturn]] void raise_error(ErrorCode code, const std::string& message);

enum class Whence { set, cur, end };

// One contiguous byte range of a source. Order of stencils in a table
// defines the virtual layout.
struct Stencil {
  std::shared_ptr<Source> source;
  int64_t offset{0};
  int64_t length{0};
};

// (offset, length) pair for the single-source construction form.
struct Range {
  int64_t offset{0};
  int64_t length{0};
};

}  // namespace stencil
