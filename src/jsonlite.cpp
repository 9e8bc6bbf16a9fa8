#include "stencil/jsonlite.hpp"

namespace stencil::jsonlite {

namespace {

const char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string escape(const std::string& s) {
  // Fast path: event details are usually plain paths and messages.
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (u < 0x20) {
      o += "\\u00";
      o += kHexDigits[u >> 4];
      o += kHexDigits[u & 0x0f];
    } else {
      o += c;
    }
  }
  return o;
}

}  // namespace stencil::jsonlite
