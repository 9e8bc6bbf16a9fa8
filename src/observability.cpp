#include "stencil/observability.hpp"

#include <bit>
#include <cstdio>

#include "stencil/config.hpp"
#include "stencil/jsonlite.hpp"

namespace stencil {

namespace {

// Equivalent to floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::atomic<StencilEventHook> g_event_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// IoStats
// ---------------------------------------------------------------------------

void IoStats::record_read(uint64_t bytes, bool short_read) {
  if (!enabled()) return;
  raw_reads.fetch_add(1, std::memory_order_relaxed);
  bytes_read.fetch_add(bytes, std::memory_order_relaxed);
  if (short_read) short_reads.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_eof_read() {
  if (!enabled()) return;
  eof_reads.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_seek() {
  if (!enabled()) return;
  seeks.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_guarded_read() {
  if (!enabled()) return;
  guarded_reads.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_table_built() {
  if (!enabled()) return;
  tables_built.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_join_built() {
  if (!enabled()) return;
  joins_built.fetch_add(1, std::memory_order_relaxed);
}

void IoStats::record_failure(ErrorCode code) {
  if (!enabled()) return;
  failures_[static_cast<size_t>(code)].fetch_add(1, std::memory_order_relaxed);
}

uint64_t IoStats::failures(ErrorCode code) const {
  return failures_[static_cast<size_t>(code)].load(std::memory_order_relaxed);
}

void IoStats::reset() {
  raw_reads.store(0, std::memory_order_relaxed);
  bytes_read.store(0, std::memory_order_relaxed);
  short_reads.store(0, std::memory_order_relaxed);
  eof_reads.store(0, std::memory_order_relaxed);
  seeks.store(0, std::memory_order_relaxed);
  guarded_reads.store(0, std::memory_order_relaxed);
  tables_built.store(0, std::memory_order_relaxed);
  joins_built.store(0, std::memory_order_relaxed);
  for (auto& f : failures_) f.store(0, std::memory_order_relaxed);
  read_latency.reset();
}

std::string IoStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"raw_reads\":";
  out += std::to_string(raw_reads.load(std::memory_order_relaxed));
  out += ",\"bytes_read\":";
  out += std::to_string(bytes_read.load(std::memory_order_relaxed));
  out += ",\"short_reads\":";
  out += std::to_string(short_reads.load(std::memory_order_relaxed));
  out += ",\"eof_reads\":";
  out += std::to_string(eof_reads.load(std::memory_order_relaxed));
  out += ",\"seeks\":";
  out += std::to_string(seeks.load(std::memory_order_relaxed));
  out += ",\"guarded_reads\":";
  out += std::to_string(guarded_reads.load(std::memory_order_relaxed));
  out += ",\"tables_built\":";
  out += std::to_string(tables_built.load(std::memory_order_relaxed));
  out += ",\"joins_built\":";
  out += std::to_string(joins_built.load(std::memory_order_relaxed));

  out += ",\"failures\":{";
  bool first = true;
  for (size_t i = 1; i < kErrorCodes; ++i) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += to_string(static_cast<ErrorCode>(i));
    out += "\":";
    out += std::to_string(failures_[i].load(std::memory_order_relaxed));
  }
  out += '}';

  out += ",\"read_latency\":";
  out += read_latency.to_json();
  out += '}';
  return out;
}

IoStats& global_io_stats() {
  static IoStats stats;
  static const bool configured = [] {
    stats.set_enabled(global_config().stats_enabled);
    return true;
  }();
  (void)configured;
  return stats;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void set_event_hook(StencilEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string event_to_json(const StencilEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += jsonlite::escape(ev.kind);
  line += "\",\"fingerprint\":\"";
  line += ev.fingerprint;
  line += "\",\"stencils\":";
  line += std::to_string(ev.stencils);
  line += ",\"total_size\":";
  line += std::to_string(ev.total_size);
  line += ",\"dropped\":";
  line += std::to_string(ev.dropped);
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}";
  return line;
}

bool events_enabled() {
  return g_event_hook.load(std::memory_order_acquire) != nullptr ||
         !global_config().event_log.empty();
}

void emit_event(const StencilEvent& ev) {
  StencilEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string log_path = global_config().event_log;
  if (log_path.empty()) return;

  std::string line = event_to_json(ev);
  line += '\n';

  // O_APPEND keeps concurrent lines whole for writes < PIPE_BUF.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace stencil
