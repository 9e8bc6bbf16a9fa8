#pragma once

// stencil/joined_file.hpp - Whole sources concatenated into one virtual file.
//
// Used for split and multi-volume inputs (archive.001, archive.002, ...).
// Each source contributes one stencil (source, 0, size) in list order; its
// size is found by seeking to its end, so every source must be seekable.
// Empty sources are dropped by the StencilTable normalization.
//
// A JoinedFile keeps every opened source alive (including dropped empty ones)
// for its own lifetime but never closes them.

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "stencil/buffered_file.hpp"
#include "stencil/source.hpp"
#include "stencil/stencil_table.hpp"

namespace stencil {

// Opens one physical source on demand. Must not return nullptr.
using SourceFactory = std::function<std::shared_ptr<Source>()>;

class JoinedFile : public BufferedStenciledFile {
 public:
  JoinedFile(std::shared_ptr<const StencilTable> table,
             std::vector<std::shared_ptr<Source>> sources,
             std::shared_ptr<std::mutex> guard, std::size_t buffer_size);

  // All opened sources in list order, including empty ones.
  const std::vector<std::shared_ptr<Source>>& sources() const { return sources_; }

 private:
  std::vector<std::shared_ptr<Source>> sources_;
};

// One (source, 0, size) stencil per source. Throws size_query_failed.
std::vector<Stencil> whole_source_stencils(const std::vector<std::shared_ptr<Source>>& sources);

// Opens the factories in order and joins the resulting sources.
std::unique_ptr<JoinedFile> join_factories(const std::vector<SourceFactory>& factories,
                                           std::shared_ptr<std::mutex> guard = nullptr,
                                           std::size_t buffer_size = 0);

// Joins sources that are already open.
std::unique_ptr<JoinedFile> join_sources(std::vector<std::shared_ptr<Source>> sources,
                                         std::shared_ptr<std::mutex> guard = nullptr,
                                         std::size_t buffer_size = 0);

// Convenience: one FileSource per path, opened lazily in order.
std::unique_ptr<JoinedFile> join_paths(const std::vector<std::string>& paths,
                                       std::shared_ptr<std::mutex> guard = nullptr,
                                       std::size_t buffer_size = 0);

}  // namespace stencil
