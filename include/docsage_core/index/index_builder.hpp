#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docsage_core/embedding/embedder.hpp"
#include "docsage_core/index/vector_index.hpp"
#include "docsage_core/ingest/chunker.hpp"
#include "docsage_core/ingest/source_loader.hpp"

namespace docsage_core {

/**
 * @class IndexBuilder
 * @brief Runs load -> chunk -> embed over a source tree and produces a new index.
 *
 * The build is all-or-nothing: an EmbeddingError aborts it and no index is
 * returned. Files that fail to load are skipped by the loader.
 */
class IndexBuilder {
 public:
  IndexBuilder(std::shared_ptr<SourceLoader> source_loader,
               Chunker chunker,
               std::shared_ptr<Embedder> embedder,
               std::string embedding_model,
               SearchOptions search_options);

  std::shared_ptr<VectorIndex> build(const std::filesystem::path &docs_dir) const;

  // What a freshly built index is expected to carry
  IndexFingerprint expected_fingerprint() const;

  const SearchOptions &search_options() const { return search_options_; }

  // SHA-256 over source, chunk index and content
  static std::string make_entry_id(const Chunk &chunk);

 private:
  std::shared_ptr<SourceLoader> source_loader_;
  Chunker chunker_;
  std::shared_ptr<Embedder> embedder_;
  std::string embedding_model_;
  SearchOptions search_options_;
};

}  // namespace docsage_core
