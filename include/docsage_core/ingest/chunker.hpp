#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "docsage_core/types/chunk.hpp"
#include "docsage_core/types/document.hpp"

namespace docsage_core {

/**
 * @class ChunkCursor
 * @brief Lazily produces the chunks of one document.
 *
 * The cursor refers to the document it was created from, so the document must
 * outlive it.
 */
class ChunkCursor {
 public:
  // Returns the next window, or std::nullopt once the text is covered
  std::optional<Chunk> next();

 private:
  friend class Chunker;
  ChunkCursor(const Document& document, size_t chunk_size, size_t chunk_overlap);

  const Document* document_;
  size_t chunk_size_;
  size_t step_;
  size_t text_length_;
  size_t start_offset_ = 0;
  std::string::const_iterator window_start_;
  int next_index_ = 0;
  bool done_ = false;
};

/**
 * @class Chunker
 * @brief Sliding-window splitter measured in Unicode code points.
 *
 * Each window holds at most `chunk_size` code points and starts
 * `chunk_size - chunk_overlap` code points after the previous one. The last
 * window may be shorter and always ends at the end of the text.
 */
class Chunker {
 public:
  // Throws ConfigError if chunk_size is 0 or chunk_overlap >= chunk_size
  Chunker(size_t chunk_size, size_t chunk_overlap);

  ChunkCursor chunks(const Document& document) const;

  std::vector<Chunk> split(const Document& document) const;

  size_t chunk_size() const { return chunk_size_; }
  size_t chunk_overlap() const { return chunk_overlap_; }

 private:
  size_t chunk_size_;
  size_t chunk_overlap_;
};

}  // namespace docsage_core
