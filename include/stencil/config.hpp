#pragma once

// stencil/config.hpp - Process-wide configuration read from the environment.
//
//   STENCIL_BUFFER_SIZE  default read-ahead buffer of BufferedStenciledFile
//                        (bytes, default 65536; invalid or zero -> default)
//   STENCIL_EVENT_LOG    path of the JSONL event sink (unset/empty = off)
//   STENCIL_STATS        "0" disables IoStats counter updates
//
// The configuration is loaded once on first use. set_global_config() replaces
// it; tests use this to point the event log at a temporary file.

#include <cstddef>
#include <string>

namespace stencil {

constexpr std::size_t kDefaultBufferSize = 64 * 1024;

struct StencilConfig {
  std::size_t buffer_size{kDefaultBufferSize};
  std::string event_log;
  bool stats_enabled{true};
};

// Read STENCIL_* variables. Never throws.
StencilConfig load_config();

StencilConfig global_config();
void set_global_config(const StencilConfig& config);

}  // namespace stencil
