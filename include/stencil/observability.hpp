#pragma once

// stencil/observability.hpp - Counters, latency histogram and event sink.
//
// DESIGN:
//   IoStats is a process-wide set of relaxed atomic counters updated on every
//   raw read and seek. Counters never influence I/O results; they exist for
//   diagnostics only (IoStats::to_json()).
//
//   StencilEvent is emitted on table construction, join construction and on
//   every failure. Events go to the registered hook if one is set, otherwise
//   they are appended as one JSON line to STENCIL_EVENT_LOG.
//
// Invariant: event emission never throws and never blocks on the sources.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "stencil/types.hpp"

namespace stencil {

struct StencilEvent {
  std::string kind;          // "table_built", "join_built" or "error"
  std::string fingerprint;   // table_fingerprint() of the table, if any
  uint64_t stencils{0};      // normalized stencil count
  int64_t total_size{0};     // virtual size in bytes
  uint64_t dropped{0};       // zero-length entries removed at construction
  std::string error_code;
  std::string detail;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if no samples recorded.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;
  void reset();

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// IoStats - global aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters sit on separate cache lines since views on different
// threads bump them concurrently.
class IoStats {
 public:
  void record_read(uint64_t bytes, bool short_read);
  void record_eof_read();
  void record_seek();
  void record_guarded_read();
  void record_table_built();
  void record_join_built();
  void record_failure(ErrorCode code);

  uint64_t failures(ErrorCode code) const;

  bool enabled() const { return enabled_.load(std::memory_order_relaxed); }
  void set_enabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }

  void reset();
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> raw_reads{0};
  alignas(64) std::atomic<uint64_t> bytes_read{0};
  alignas(64) std::atomic<uint64_t> short_reads{0};  // stopped at a stencil boundary
  alignas(64) std::atomic<uint64_t> eof_reads{0};
  alignas(64) std::atomic<uint64_t> seeks{0};
  alignas(64) std::atomic<uint64_t> guarded_reads{0};
  alignas(64) std::atomic<uint64_t> tables_built{0};
  alignas(64) std::atomic<uint64_t> joins_built{0};

  LatencyHistogram read_latency;

 private:
  static constexpr size_t kErrorCodes = static_cast<size_t>(ErrorCode::io_error) + 1;
  std::array<std::atomic<uint64_t>, kErrorCodes> failures_{};
  std::atomic<bool> enabled_{true};
};

// Singleton accessor. STENCIL_STATS is consulted on first call.
IoStats& global_io_stats();

using StencilEventHook = void (*)(const StencilEvent&);
void set_event_hook(StencilEventHook hook);

// True when a hook is registered or STENCIL_EVENT_LOG names a sink. Callers
// skip building costly event fields (fingerprints) otherwise.
bool events_enabled();

// Fire-and-forget. Appends to STENCIL_EVENT_LOG when no hook is registered.
void emit_event(const StencilEvent& ev);

std::string event_to_json(const StencilEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace stencil
