#include "stencil/config.hpp"

#include <cstdlib>
#include <mutex>

namespace stencil {

namespace {

std::mutex g_config_mu;
StencilConfig g_config;
bool g_config_loaded{false};

std::size_t parse_size(const char* text, std::size_t fallback) {
  if (!text || !text[0]) return fallback;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text, &end, 10);
  if (end == text || *end != '\0' || v == 0) return fallback;
  return static_cast<std::size_t>(v);
}

}  // namespace

StencilConfig load_config() {
  StencilConfig c;
  c.buffer_size = parse_size(std::getenv("STENCIL_BUFFER_SIZE"), kDefaultBufferSize);
  if (const char* e = std::getenv("STENCIL_EVENT_LOG")) {
    c.event_log = e;
  }
  if (const char* e = std::getenv("STENCIL_STATS")) {
    c.stats_enabled = std::string(e) != "0";
  }
  return c;
}

StencilConfig global_config() {
  std::lock_guard<std::mutex> lk(g_config_mu);
  if (!g_config_loaded) {
    g_config = load_config();
    g_config_loaded = true;
  }
  return g_config;
}

void set_global_config(const StencilConfig& config) {
  std::lock_guard<std::mutex> lk(g_config_mu);
  g_config = config;
  if (g_config.buffer_size == 0) g_config.buffer_size = kDefaultBufferSize;
  g_config_loaded = true;
}

}  // namespace stencil
