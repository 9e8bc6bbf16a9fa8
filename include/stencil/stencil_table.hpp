#pragma once

// stencil/stencil_table.hpp - Normalized stencil layout and offset lookup.
//
// INVARIANTS (established by the constructor, never changed afterwards):
//   1. Every stored stencil has length > 0. Zero-length entries are dropped;
//      a stored empty region would make read() return nothing before the
//      end of the virtual file.
//   2. cumsizes().size() == size() + 1, cumsizes()[0] == 0 and
//      cumsizes()[i+1] == cumsizes()[i] + (*this)[i].length.
//   3. For every o in [0, total_size()) exactly one i satisfies
//      cumsizes()[i] <= o < cumsizes()[i+1]; lookup(o) returns it.
//
// The table performs no I/O beyond the readable() capability query.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "stencil/source.hpp"
#include "stencil/types.hpp"

namespace stencil {

class StencilTable {
 public:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  // Canonical form: explicit (source, offset, length) triples.
  explicit StencilTable(std::vector<Stencil> stencils);

  // One source repeated for every (offset, length) pair.
  StencilTable(std::shared_ptr<Source> source, const std::vector<Range>& ranges);

  // Index of the stencil containing virtual offset o, or npos when
  // o < 0 or o >= total_size(). O(log n).
  std::size_t lookup(int64_t o) const;

  std::size_t size() const { return stencils_.size(); }
  bool empty() const { return stencils_.empty(); }
  int64_t total_size() const { return cumsizes_.back(); }

  const Stencil& operator[](std::size_t i) const { return stencils_[i]; }
  const std::vector<Stencil>& stencils() const { return stencils_; }
  const std::vector<int64_t>& cumsizes() const { return cumsizes_; }

  // Distinct sources, in order of first appearance.
  const std::vector<std::shared_ptr<Source>>& sources() const { return sources_; }

  // Zero-length entries removed during normalization.
  std::size_t dropped() const { return dropped_; }

 private:
  void normalize();

  std::vector<Stencil> stencils_;
  std::vector<int64_t> cumsizes_{0};
  std::vector<std::shared_ptr<Source>> sources_;
  std::size_t dropped_{0};
};

}  // namespace stencil
