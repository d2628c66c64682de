#pragma once

#include <memory>
#include <string>

#include "docsage_core/config.hpp"
#include "docsage_core/index/index_manager.hpp"
#include "docsage_core/llm/ollama_client.hpp"
#include "docsage_core/services/generation_service.hpp"
#include "docsage_core/services/retrieval_service.hpp"

namespace docsage_core {

/**
 * @class RagPipeline
 * @brief Caller-facing entry point: index lifecycle, retrieval and generation.
 *
 * Wires the loader, chunker, embedder, index store and services from one
 * validated Config. The OllamaClient is injected so tests can pass a mock.
 */
class RagPipeline {
 public:
  RagPipeline(const Config &config, std::shared_ptr<OllamaClient> ollama_client);

  IndexHandle build_or_load_index();
  IndexHandle rebuild_index();

  RetrievalResult retrieve(const std::string &query, int k) const;
  std::string generate(const std::string &query, const RetrievalResult &context) const;

  IndexHandle index() const { return index_manager_->current(); }
  const Config &config() const { return config_; }

 private:
  Config config_;
  std::shared_ptr<IndexManager> index_manager_;
  std::unique_ptr<RetrievalService> retrieval_service_;
  std::unique_ptr<GenerationService> generation_service_;
};

}  // namespace docsage_core
