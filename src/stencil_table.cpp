#include "stencil/stencil_table.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

#include "stencil/hash.hpp"
#include "stencil/observability.hpp"

namespace stencil {

namespace {

std::vector<Stencil> repeat_source(const std::shared_ptr<Source>& source,
                                   const std::vector<Range>& ranges) {
  std::vector<Stencil> out;
  out.reserve(ranges.size());
  for (const auto& r : ranges) {
    out.push_back(Stencil{source, r.offset, r.length});
  }
  return out;
}

}  // namespace

StencilTable::StencilTable(std::vector<Stencil> stencils)
    : stencils_(std::move(stencils)) {
  normalize();
}

StencilTable::StencilTable(std::shared_ptr<Source> source,
                           const std::vector<Range>& ranges)
    : stencils_(repeat_source(source, ranges)) {
  normalize();
}

void StencilTable::normalize() {
  for (std::size_t i = 0; i < stencils_.size(); ++i) {
    const Stencil& s = stencils_[i];
    if (!s.source) {
      raise_error(ErrorCode::invalid_stencil,
                  "stencil " + std::to_string(i) + " has no source");
    }
    if (s.offset < 0 || s.length < 0) {
      raise_error(ErrorCode::invalid_stencil,
                  "stencil " + std::to_string(i) + " has offset " +
                      std::to_string(s.offset) + " and length " +
                      std::to_string(s.length));
    }
  }

  // Readability is checked per distinct source, including sources that only
  // appear in zero-length stencils.
  std::unordered_set<const Source*> seen;
  seen.reserve(stencils_.size());
  for (const auto& s : stencils_) {
    if (!seen.insert(s.source.get()).second) continue;
    if (!s.source->readable()) {
      raise_error(ErrorCode::not_readable,
                  s.source->describe() + " is not readable");
    }
    sources_.push_back(s.source);
  }

  const auto before = stencils_.size();
  stencils_.erase(std::remove_if(stencils_.begin(), stencils_.end(),
                                 [](const Stencil& s) { return s.length == 0; }),
                  stencils_.end());
  dropped_ = before - stencils_.size();

  // Sources that only backed dropped stencils are not part of the view.
  if (dropped_ > 0) {
    std::unordered_set<const Source*> used;
    used.reserve(sources_.size());
    for (const auto& s : stencils_) used.insert(s.source.get());
    sources_.erase(std::remove_if(sources_.begin(), sources_.end(),
                                  [&used](const std::shared_ptr<Source>& src) {
                                    return used.count(src.get()) == 0;
                                  }),
                   sources_.end());
  }

  cumsizes_.reserve(stencils_.size() + 1);
  for (const auto& s : stencils_) {
    cumsizes_.push_back(cumsizes_.back() + s.length);
  }

  global_io_stats().record_table_built();
  if (!events_enabled()) return;
  StencilEvent ev;
  ev.kind = "table_built";
  ev.fingerprint = table_fingerprint(*this);
  ev.stencils = stencils_.size();
  ev.total_size = total_size();
  ev.dropped = dropped_;
  emit_event(ev);
}

std::size_t StencilTable::lookup(int64_t o) const {
  if (o < 0 || o >= total_size()) return npos;
  // First boundary strictly greater than o; the stencil starts one before it.
  const auto it = std::upper_bound(cumsizes_.begin(), cumsizes_.end(), o);
  return static_cast<std::size_t>(it - cumsizes_.begin()) - 1;
}

}  // namespace stencil
