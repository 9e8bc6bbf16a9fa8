#include "stencil/hash.hpp"

#include <array>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "stencil/buffered_file.hpp"
#include "stencil/stencil_table.hpp"

extern "C" {
#include <blake3.h>
}

namespace stencil {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

// Little-endian so fingerprints agree across hosts.
void update_u64(blake3_hasher& hasher, uint64_t v) {
  unsigned char bytes[8];
  for (int i = 0; i < 8; ++i) bytes[i] = static_cast<unsigned char>(v >> (8 * i));
  blake3_hasher_update(&hasher, bytes, sizeof(bytes));
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_view_blake3_hex(BufferedStenciledFile& file) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);

  constexpr std::size_t buffer_size = 65536;
  std::vector<char> buffer(buffer_size);
  for (;;) {
    const std::size_t count = file.read_into(buffer.data(), buffer.size());
    if (count == 0) break;
    blake3_hasher_update(&hasher, buffer.data(), count);
  }
  return finalize_hex(hasher);
}

std::string table_fingerprint(const StencilTable& table) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  constexpr std::string_view domain = "stencil:";
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  update_u64(hasher, table.size());

  std::unordered_map<const Source*, uint64_t> slots;
  slots.reserve(table.sources().size());
  for (const auto& src : table.sources()) {
    slots.emplace(src.get(), static_cast<uint64_t>(slots.size()));
  }
  for (const auto& s : table.stencils()) {
    update_u64(hasher, slots.at(s.source.get()));
    update_u64(hasher, static_cast<uint64_t>(s.offset));
    update_u64(hasher, static_cast<uint64_t>(s.length));
  }
  return finalize_hex(hasher);
}

}  // namespace stencil
