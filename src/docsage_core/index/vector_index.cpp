#include "docsage_core/index/vector_index.hpp"

#include <faiss/IndexHNSW.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace docsage_core {

namespace {

// Higher score first, earlier insertion wins ties
bool ranks_before(const std::pair<float, size_t> &a, const std::pair<float, size_t> &b) {
  if (a.first != b.first) {
    return a.first > b.first;
  }
  return a.second < b.second;
}

}  // namespace

std::string IndexFingerprint::to_string() const {
  return "model=" + embedding_model + ", dimension=" + std::to_string(dimension) +
         ", chunk_size=" + std::to_string(chunk_size) +
         ", chunk_overlap=" + std::to_string(chunk_overlap);
}

SearchMode search_mode_from_string(const std::string &str) {
  if (str == "exact") return SearchMode::Exact;
  if (str == "hnsw") return SearchMode::Hnsw;
  throw std::invalid_argument("Unknown search mode: " + str);
}

std::string to_string(SearchMode mode) {
  switch (mode) {
    case SearchMode::Exact:
      return "exact";
    case SearchMode::Hnsw:
      return "hnsw";
  }
  return "exact";
}

VectorIndex::VectorIndex(IndexFingerprint fingerprint,
                         std::vector<EmbeddedChunk> entries,
                         SearchOptions options)
    : fingerprint_(std::move(fingerprint)), entries_(std::move(entries)), options_(options) {
  if (entries_.empty()) {
    return;
  }

  const size_t dimension = entries_.front().vector_embedding.size();
  if (dimension == 0) {
    throw VectorIndexError("Cannot index an empty vector");
  }
  if (fingerprint_.dimension == 0) {
    fingerprint_.dimension = dimension;
  } else if (fingerprint_.dimension != dimension) {
    throw VectorIndexError("Entries have dimension " + std::to_string(dimension) +
                           " but the fingerprint declares " +
                           std::to_string(fingerprint_.dimension));
  }

  std::unordered_set<std::string> seen_ids;
  normalized_vectors_.reserve(entries_.size() * dimension);
  for (const auto &entry : entries_) {
    if (entry.vector_embedding.size() != dimension) {
      throw VectorIndexError("Entry " + entry.id + " has dimension " +
                             std::to_string(entry.vector_embedding.size()) + ", expected " +
                             std::to_string(dimension));
    }
    if (!seen_ids.insert(entry.id).second) {
      throw VectorIndexError("Duplicate entry id: " + entry.id);
    }
    normalized_vectors_.insert(normalized_vectors_.end(), entry.vector_embedding.begin(),
                               entry.vector_embedding.end());
  }

  // Zero vectors are left as they are and therefore score 0 against anything
  faiss::fvec_renorm_L2(dimension, entries_.size(), normalized_vectors_.data());

  if (options_.mode == SearchMode::Hnsw) {
    hnsw_index_ = std::make_unique<faiss::IndexHNSWFlat>(
        static_cast<int>(dimension), options_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
    hnsw_index_->hnsw.efSearch = options_.hnsw_ef_search;
    hnsw_index_->add(static_cast<faiss::idx_t>(entries_.size()), normalized_vectors_.data());
  }
}

VectorIndex::~VectorIndex() = default;

RetrievalResult VectorIndex::query(const std::vector<float> &query_vector, int k) const {
  if (k <= 0 || entries_.empty()) {
    return {};
  }

  const size_t dimension = fingerprint_.dimension;
  if (query_vector.size() != dimension) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension) + ", got " +
                           std::to_string(query_vector.size()));
  }

  std::vector<float> query = query_vector;
  faiss::fvec_renorm_L2(dimension, 1, query.data());

  const size_t actual_k = std::min(static_cast<size_t>(k), entries_.size());
  std::vector<std::pair<float, size_t>> ranked;

  if (hnsw_index_) {
    std::vector<float> distances(actual_k);
    std::vector<faiss::idx_t> labels(actual_k);
    faiss::SearchParametersHNSW params;
    params.efSearch = std::max(options_.hnsw_ef_search, static_cast<int>(actual_k));
    hnsw_index_->search(1, query.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                        labels.data(), &params);

    // Re-score the candidates so both modes agree on scores and ties
    for (const auto label : labels) {
      if (label < 0) {
        continue;
      }
      const auto position = static_cast<size_t>(label);
      ranked.emplace_back(faiss::fvec_inner_product(query.data(), row(position), dimension),
                          position);
    }
    std::sort(ranked.begin(), ranked.end(), ranks_before);
  } else {
    std::vector<float> scores(entries_.size());
    faiss::fvec_inner_products_ny(scores.data(), query.data(), normalized_vectors_.data(),
                                  dimension, entries_.size());

    ranked.reserve(entries_.size());
    for (size_t position = 0; position < scores.size(); ++position) {
      ranked.emplace_back(scores[position], position);
    }
    std::partial_sort(ranked.begin(), ranked.begin() + actual_k, ranked.end(), ranks_before);
    ranked.resize(actual_k);
  }

  return to_result(ranked);
}

size_t VectorIndex::document_count() const {
  std::unordered_set<std::string> sources;
  for (const auto &entry : entries_) {
    sources.insert(entry.chunk.source);
  }
  return sources.size();
}

RetrievalResult VectorIndex::to_result(const std::vector<std::pair<float, size_t>> &ranked) const {
  RetrievalResult result;
  result.reserve(ranked.size());
  for (const auto &[score, position] : ranked) {
    const EmbeddedChunk &entry = entries_[position];
    result.push_back({.id = entry.id,
                      .content = entry.chunk.content,
                      .source = entry.chunk.source,
                      .chunk_index = entry.chunk.chunk_index,
                      .metadata = entry.chunk.metadata,
                      .score = score});
  }
  return result;
}

}  // namespace docsage_core
