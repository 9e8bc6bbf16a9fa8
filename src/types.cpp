#include "stencil/types.hpp"

#include "stencil/observability.hpp"

namespace stencil {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_stencil: return "invalid_stencil";
    case ErrorCode::not_readable: return "not_readable";
    case ErrorCode::invalid_seek: return "invalid_seek";
    case ErrorCode::closed_source: return "closed_source";
    case ErrorCode::size_query_failed: return "size_query_failed";
    case ErrorCode::unsupported_operation: return "unsupported_operation";
    case ErrorCode::io_error: return "io_error";
  }
  return "";
}

StencilError::StencilError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

void raise_error(ErrorCode code, const std::string& message) {
  global_io_stats().record_failure(code);

  StencilEvent ev;
  ev.kind = "error";
  ev.error_code = to_string(code);
  ev.detail = message;
  emit_event(ev);

  throw StencilError(code, message);
}

}  // namespace stencil
