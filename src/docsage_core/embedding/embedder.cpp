#include "docsage_core/embedding/embedder.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <stdexcept>
#include <iostream>
#include <thread>

namespace docsage_core {

Embedder::Embedder(std::shared_ptr<OllamaClient> ollama_client, EmbedderOptions options)
    : ollama_client_(std::move(ollama_client)), options_(options) {
  if (!ollama_client_) {
    throw std::invalid_argument("Embedder requires an OllamaClient");
  }
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
  if (options_.parallelism == 0) {
    options_.parallelism = 1;
  }
}

std::vector<std::vector<float>> Embedder::embed(const std::vector<std::string> &texts) const {
  if (texts.empty()) {
    return {};
  }

  std::vector<std::vector<std::string>> batches;
  for (size_t start = 0; start < texts.size(); start += options_.batch_size) {
    const size_t end = std::min(start + options_.batch_size, texts.size());
    batches.emplace_back(texts.begin() + start, texts.begin() + end);
  }

  // One slot per batch; workers never touch the same slot
  std::vector<std::vector<std::vector<float>>> slots(batches.size());
  std::atomic<size_t> next_batch{0};
  std::atomic<bool> failed{false};

  auto worker = [&]() {
    while (!failed.load()) {
      const size_t batch_number = next_batch.fetch_add(1);
      if (batch_number >= batches.size()) {
        return;
      }
      try {
        slots[batch_number] = embed_batch(batches[batch_number], batch_number);
      } catch (...) {
        failed.store(true);
        throw;
      }
    }
  };

  const size_t worker_count = std::min(options_.parallelism, batches.size());
  std::vector<std::future<void>> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::async(std::launch::async, worker));
  }

  std::exception_ptr first_error;
  for (auto &future : workers) {
    try {
      future.get();
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  }
  if (first_error) {
    std::rethrow_exception(first_error);
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (auto &slot : slots) {
    for (auto &vector : slot) {
      vectors.push_back(std::move(vector));
    }
  }

  validate_dimensions(vectors);
  return vectors;
}

std::vector<float> Embedder::embed_one(const std::string &text) const {
  auto vectors = embed({text});
  return std::move(vectors.front());
}

std::vector<std::vector<float>> Embedder::embed_batch(const std::vector<std::string> &batch,
                                                      size_t batch_number) const {
  std::string last_error;
  const int attempts = options_.max_retries + 1;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      auto vectors = ollama_client_->get_embeddings(batch);
      if (vectors.size() != batch.size()) {
        throw EmbeddingError("Embedding batch " + std::to_string(batch_number) + " returned " +
                             std::to_string(vectors.size()) + " vectors for " +
                             std::to_string(batch.size()) + " inputs");
      }
      return vectors;
    } catch (const OllamaError &e) {
      last_error = e.what();
      if (attempt < attempts) {
        std::cerr << "[Embedder] Batch " << batch_number << " failed (attempt " << attempt << "/"
                  << attempts << "): " << last_error << std::endl;
        std::this_thread::sleep_for(options_.retry_backoff * attempt);
      }
    }
  }

  throw EmbeddingError("Embedding batch " + std::to_string(batch_number) + " failed after " +
                       std::to_string(attempts) + " attempts: " + last_error);
}

void Embedder::validate_dimensions(const std::vector<std::vector<float>> &vectors) const {
  if (vectors.empty()) {
    return;
  }

  const size_t dimension = vectors.front().size();
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].empty()) {
      throw EmbeddingError("Embedding model returned an empty vector for input " +
                           std::to_string(i));
    }
    if (vectors[i].size() != dimension) {
      throw EmbeddingError("Inconsistent embedding dimension: input " + std::to_string(i) +
                           " has " + std::to_string(vectors[i].size()) + ", expected " +
                           std::to_string(dimension));
    }
  }

  if (options_.expected_dimension > 0 && dimension != options_.expected_dimension) {
    throw EmbeddingError("Embedding dimension " + std::to_string(dimension) +
                         " does not match the configured dimension " +
                         std::to_string(options_.expected_dimension));
  }
}

}  // namespace docsage_core
