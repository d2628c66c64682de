#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docsage_core/types/chunk.hpp"
#include "docsage_core/types/retrieval.hpp"

namespace faiss {
struct IndexHNSWFlat;
}

namespace docsage_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Identifies what produced the vectors; two indexes are interchangeable only
// when their fingerprints are equal.
struct IndexFingerprint {
  std::string embedding_model;
  size_t dimension = 0;
  size_t chunk_size = 0;
  size_t chunk_overlap = 0;

  bool operator==(const IndexFingerprint &other) const = default;
  std::string to_string() const;
};

enum class SearchMode { Exact, Hnsw };

// Throws std::invalid_argument for anything other than "exact" or "hnsw"
SearchMode search_mode_from_string(const std::string &str);
std::string to_string(SearchMode mode);

struct SearchOptions {
  SearchMode mode = SearchMode::Exact;
  int hnsw_m = 32;
  int hnsw_ef_search = 64;
};

/**
 * @class VectorIndex
 * @brief Immutable set of embedded chunks answering cosine top-K queries.
 *
 * Vectors are L2-normalized once at construction so a query is a plain inner
 * product. Results are ordered by descending score, ties by insertion order.
 * In HNSW mode the graph only proposes candidates; they are re-scored and
 * ordered the same way as an exact scan.
 *
 * All methods are const, so any number of threads may query one instance.
 */
class VectorIndex {
 public:
  // Throws VectorIndexError on mixed dimensions, duplicate ids or a
  // fingerprint whose dimension disagrees with the entries.
  VectorIndex(IndexFingerprint fingerprint,
              std::vector<EmbeddedChunk> entries,
              SearchOptions options = {});
  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // k <= 0 or an empty index yields an empty result.
  // Throws VectorIndexError when the query dimension differs from the index.
  RetrievalResult query(const std::vector<float> &query_vector, int k) const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  size_t dimension() const { return fingerprint_.dimension; }
  const IndexFingerprint &fingerprint() const { return fingerprint_; }
  const std::vector<EmbeddedChunk> &entries() const { return entries_; }
  const SearchOptions &search_options() const { return options_; }

  // Number of distinct sources among the entries
  size_t document_count() const;

 private:
  IndexFingerprint fingerprint_;
  std::vector<EmbeddedChunk> entries_;
  SearchOptions options_;

  // entries_.size() rows of dimension() floats, unit length or all zero
  std::vector<float> normalized_vectors_;
  std::unique_ptr<faiss::IndexHNSWFlat> hnsw_index_;

  const float *row(size_t position) const {
    return normalized_vectors_.data() + position * fingerprint_.dimension;
  }
  RetrievalResult to_result(const std::vector<std::pair<float, size_t>> &ranked) const;
};

}  // namespace docsage_core
