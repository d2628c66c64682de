#include "docsage_core/services/retrieval_service.hpp"

namespace docsage_core {

RetrievalService::RetrievalService(std::shared_ptr<Embedder> embedder,
                                   std::shared_ptr<IndexManager> index_manager)
    : embedder_(std::move(embedder)), index_manager_(std::move(index_manager)) {}

RetrievalResult RetrievalService::retrieve(const std::string &query, int k) const {
  // Hold one snapshot for the whole query, even if a rebuild swaps the index meanwhile
  const IndexHandle index = index_manager_->current();
  if (!index) {
    throw VectorIndexError("No index has been built or loaded");
  }
  if (k <= 0 || index->empty()) {
    return {};
  }

  const std::vector<float> query_vector = embedder_->embed_one(query);
  return index->query(query_vector, k);
}

}  // namespace docsage_core
