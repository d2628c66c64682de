#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docsage_core {

// A window of a document's text. Offsets are in code points, end exclusive.
struct Chunk {
  std::string content;
  int chunk_index = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  std::string source;
  nlohmann::json metadata = nlohmann::json::object();
};

struct EmbeddedChunk {
  std::string id;
  Chunk chunk;
  std::vector<float> vector_embedding;
};

}  // namespace docsage_core
