#include "docsage_core/ingest/chunker.hpp"

#include <algorithm>

#include <utf8.h>

#include "docsage_core/config.hpp"

namespace docsage_core {

ChunkCursor::ChunkCursor(const Document& document, size_t chunk_size, size_t chunk_overlap)
    : document_(&document),
      chunk_size_(chunk_size),
      step_(chunk_size - chunk_overlap),
      text_length_(utf8::distance(document.content.begin(), document.content.end())),
      window_start_(document.content.begin()),
      done_(document.content.empty()) {}

std::optional<Chunk> ChunkCursor::next() {
  if (done_) {
    return std::nullopt;
  }

  const auto text_end = document_->content.end();
  const size_t window_length = std::min(chunk_size_, text_length_ - start_offset_);

  auto window_end = window_start_;
  utf8::advance(window_end, window_length, text_end);

  Chunk chunk;
  chunk.content = std::string(window_start_, window_end);
  chunk.chunk_index = next_index_++;
  chunk.start_offset = start_offset_;
  chunk.end_offset = start_offset_ + window_length;
  chunk.source = document_->path;
  chunk.metadata = document_->metadata;

  if (chunk.end_offset == text_length_) {
    done_ = true;
  } else {
    utf8::advance(window_start_, step_, text_end);
    start_offset_ += step_;
  }
  return chunk;
}

Chunker::Chunker(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap) {
  if (chunk_size_ == 0) {
    throw ConfigError("chunk_size must be greater than 0");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw ConfigError("chunk_overlap (" + std::to_string(chunk_overlap_) +
                      ") must be smaller than chunk_size (" + std::to_string(chunk_size_) + ")");
  }
}

ChunkCursor Chunker::chunks(const Document& document) const {
  return ChunkCursor(document, chunk_size_, chunk_overlap_);
}

std::vector<Chunk> Chunker::split(const Document& document) const {
  std::vector<Chunk> result;
  auto cursor = chunks(document);
  while (auto chunk = cursor.next()) {
    result.push_back(std::move(*chunk));
  }
  return result;
}

}  // namespace docsage_core
