#include "stencil/joined_file.hpp"

#include <string>

#include "stencil/hash.hpp"
#include "stencil/observability.hpp"

namespace stencil {

namespace {

int64_t query_size(Source& source, std::size_t index) {
  if (!source.seekable()) {
    raise_error(ErrorCode::size_query_failed,
                "cannot query size of " + source.describe() + " (source " +
                    std::to_string(index) + "): not seekable");
  }
  try {
    return source.seek(0, Whence::end);
  } catch (const StencilError& e) {
    raise_error(ErrorCode::size_query_failed,
                "cannot query size of " + source.describe() + " (source " +
                    std::to_string(index) + "): " + e.what());
  }
}

}  // namespace

JoinedFile::JoinedFile(std::shared_ptr<const StencilTable> table,
                       std::vector<std::shared_ptr<Source>> sources,
                       std::shared_ptr<std::mutex> guard, std::size_t buffer_size)
    : BufferedStenciledFile(std::move(table), std::move(guard), buffer_size),
      sources_(std::move(sources)) {}

std::vector<Stencil> whole_source_stencils(const std::vector<std::shared_ptr<Source>>& sources) {
  std::vector<Stencil> stencils;
  stencils.reserve(sources.size());
  for (std::size_t i = 0; i < sources.size(); ++i) {
    if (!sources[i]) {
      raise_error(ErrorCode::size_query_failed,
                  "source " + std::to_string(i) + " is null");
    }
    stencils.push_back(Stencil{sources[i], 0, query_size(*sources[i], i)});
  }
  return stencils;
}

std::unique_ptr<JoinedFile> join_sources(std::vector<std::shared_ptr<Source>> sources,
                                         std::shared_ptr<std::mutex> guard,
                                         std::size_t buffer_size) {
  auto table = std::make_shared<const StencilTable>(whole_source_stencils(sources));

  global_io_stats().record_join_built();
  if (!events_enabled()) {
    return std::make_unique<JoinedFile>(std::move(table), std::move(sources),
                                        std::move(guard), buffer_size);
  }
  StencilEvent ev;
  ev.kind = "join_built";
  ev.fingerprint = table_fingerprint(*table);
  ev.stencils = table->size();
  ev.total_size = table->total_size();
  ev.dropped = table->dropped();
  ev.detail = std::to_string(sources.size()) + " sources";
  emit_event(ev);

  return std::make_unique<JoinedFile>(std::move(table), std::move(sources),
                                      std::move(guard), buffer_size);
}

std::unique_ptr<JoinedFile> join_factories(const std::vector<SourceFactory>& factories,
                                           std::shared_ptr<std::mutex> guard,
                                           std::size_t buffer_size) {
  std::vector<std::shared_ptr<Source>> sources;
  sources.reserve(factories.size());
  for (const auto& open : factories) {
    sources.push_back(open ? open() : nullptr);
  }
  return join_sources(std::move(sources), std::move(guard), buffer_size);
}

std::unique_ptr<JoinedFile> join_paths(const std::vector<std::string>& paths,
                                       std::shared_ptr<std::mutex> guard,
                                       std::size_t buffer_size) {
  std::vector<SourceFactory> factories;
  factories.reserve(paths.size());
  for (const auto& path : paths) {
    factories.push_back([path] { return std::make_shared<FileSource>(path); });
  }
  return join_factories(factories, std::move(guard), buffer_size);
}

}  // namespace stencil
