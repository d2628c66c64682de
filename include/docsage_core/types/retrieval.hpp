#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docsage_core {

struct RetrievedChunk {
  std::string id;
  std::string content;
  std::string source;
  int chunk_index = 0;
  nlohmann::json metadata = nlohmann::json::object();
  float score = 0.0f;
};

// Ordered by descending score, at most K entries
using RetrievalResult = std::vector<RetrievedChunk>;

}  // namespace docsage_core
