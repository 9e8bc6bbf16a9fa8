#pragma once

#include <string>
#include <string_view>

namespace stencil {

class BufferedStenciledFile;
class StencilTable;

// BLAKE3-256 of payload, 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// Domain-separated BLAKE3: hash(domain || payload).
std::string hash_domain(std::string_view domain, std::string_view payload);

// Stream-hash the virtual file from its current position to the end.
// Reads in 64 KiB blocks through the buffered file, so split volumes and
// scattered stencils are hashed exactly as a reader would see them.
// Leaves the file positioned at its end.
std::string hash_view_blake3_hex(BufferedStenciledFile& file);

// Digest of the layout only (no source bytes are read): stencil offsets,
// lengths and the index of each stencil's source in table.sources().
// Two tables with the same fingerprint map identical virtual offsets to
// identical (source slot, physical offset) pairs.
std::string table_fingerprint(const StencilTable& table);

}  // namespace stencil
