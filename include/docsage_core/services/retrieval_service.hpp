#pragma once

#include <memory>
#include <string>

#include "docsage_core/embedding/embedder.hpp"
#include "docsage_core/index/index_manager.hpp"
#include "docsage_core/types/retrieval.hpp"

namespace docsage_core {

class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<Embedder> embedder, std::shared_ptr<IndexManager> index_manager);

  // Embeds the query and returns the k best chunks of the current index.
  // k <= 0 and an empty index both give an empty result without calling the model.
  // Throws VectorIndexError if no index has been built or loaded yet.
  RetrievalResult retrieve(const std::string &query, int k) const;

 private:
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<IndexManager> index_manager_;
};

}  // namespace docsage_core
