#include "docsage_core/index/index_builder.hpp"

#include <iostream>

#include "docsage_core/util/hashing.hpp"

namespace docsage_core {

IndexBuilder::IndexBuilder(std::shared_ptr<SourceLoader> source_loader,
                           Chunker chunker,
                           std::shared_ptr<Embedder> embedder,
                           std::string embedding_model,
                           SearchOptions search_options)
    : source_loader_(std::move(source_loader)),
      chunker_(chunker),
      embedder_(std::move(embedder)),
      embedding_model_(std::move(embedding_model)),
      search_options_(search_options) {}

IndexFingerprint IndexBuilder::expected_fingerprint() const {
  return {.embedding_model = embedding_model_,
          .dimension = embedder_->options().expected_dimension,
          .chunk_size = chunker_.chunk_size(),
          .chunk_overlap = chunker_.chunk_overlap()};
}

std::string IndexBuilder::make_entry_id(const Chunk &chunk) {
  return sha256_hex(chunk.source + "\n" + std::to_string(chunk.chunk_index) + "\n" +
                    chunk.content);
}

std::shared_ptr<VectorIndex> IndexBuilder::build(const std::filesystem::path &docs_dir) const {
  LoadReport report = source_loader_->load(docs_dir);

  std::vector<Chunk> chunks;
  for (const Document &document : report.documents) {
    auto cursor = chunker_.chunks(document);
    while (auto chunk = cursor.next()) {
      chunks.push_back(std::move(*chunk));
    }
  }
  // Documents are not needed past this point
  report.documents.clear();

  std::cout << "[Pipeline] Embedding " << chunks.size() << " chunks" << std::endl;

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    texts.push_back(chunk.content);
  }
  std::vector<std::vector<float>> vectors = embedder_->embed(texts);

  std::vector<EmbeddedChunk> entries;
  entries.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    std::string id = make_entry_id(chunks[i]);
    entries.push_back({std::move(id), std::move(chunks[i]), std::move(vectors[i])});
  }

  IndexFingerprint fingerprint = expected_fingerprint();
  if (!entries.empty()) {
    fingerprint.dimension = entries.front().vector_embedding.size();
  }

  auto index = std::make_shared<VectorIndex>(fingerprint, std::move(entries), search_options_);
  std::cout << "[Pipeline] Built index with " << index->size() << " entries from "
            << index->document_count() << " documents" << std::endl;
  return index;
}

}  // namespace docsage_core
