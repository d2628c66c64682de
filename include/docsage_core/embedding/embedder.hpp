#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "docsage_core/llm/ollama_client.hpp"

namespace docsage_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct EmbedderOptions {
  size_t batch_size = 16;
  size_t parallelism = 1;
  int max_retries = 2;
  std::chrono::milliseconds retry_backoff{500};
  // 0 accepts whatever dimension the model returns
  size_t expected_dimension = 0;
};

/**
 * @class Embedder
 * @brief Turns texts into vectors through the embedding model, in batches.
 *
 * Batches are handed out to `parallelism` workers. Each batch writes into its
 * own pre-allocated slot, so the output order always matches the input order.
 * A batch that fails is retried `max_retries` more times with a linearly
 * growing pause before the whole call fails with EmbeddingError.
 */
class Embedder {
 public:
  Embedder(std::shared_ptr<OllamaClient> ollama_client, EmbedderOptions options);

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) const;

  // Single-item batch, used for queries
  std::vector<float> embed_one(const std::string &text) const;

  const EmbedderOptions &options() const { return options_; }

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
  EmbedderOptions options_;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &batch,
                                              size_t batch_number) const;
  void validate_dimensions(const std::vector<std::vector<float>> &vectors) const;
};

}  // namespace docsage_core
