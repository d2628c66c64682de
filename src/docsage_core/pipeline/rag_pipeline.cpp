#include "docsage_core/pipeline/rag_pipeline.hpp"

#include "docsage_core/extractors/content_extractor_factory.hpp"

namespace docsage_core {

RagPipeline::RagPipeline(const Config &config, std::shared_ptr<OllamaClient> ollama_client)
    : config_(config) {
  auto embedder = std::make_shared<Embedder>(
      ollama_client,
      EmbedderOptions{.batch_size = static_cast<size_t>(config_.embedding_batch_size),
                      .parallelism = static_cast<size_t>(config_.embedding_parallelism),
                      .max_retries = config_.embedding_max_retries,
                      .expected_dimension = static_cast<size_t>(config_.embedding_dimension)});

  SearchOptions search_options;
  search_options.mode = search_mode_from_string(config_.search_mode);
  search_options.hnsw_m = config_.hnsw_m;
  search_options.hnsw_ef_search = config_.hnsw_ef_search;

  auto source_loader =
      std::make_shared<SourceLoader>(std::make_shared<ContentExtractorFactory>());
  auto index_builder = std::make_shared<IndexBuilder>(
      source_loader,
      Chunker(static_cast<size_t>(config_.chunk_size), static_cast<size_t>(config_.chunk_overlap)),
      embedder, config_.embedding_model, search_options);

  index_manager_ = std::make_shared<IndexManager>(
      index_builder, std::make_shared<IndexStore>(config_.index_path), config_.docs_dir);

  retrieval_service_ = std::make_unique<RetrievalService>(embedder, index_manager_);

  GenerationOptions generation_options;
  generation_options.system_prompt = config_.system_prompt;
  generation_options.max_context_chars = static_cast<size_t>(config_.max_context_chars);
  generation_options.parameters = {.temperature = config_.temperature,
                                   .max_output_tokens = config_.max_output_tokens,
                                   .context_window = config_.context_window,
                                   .repeat_penalty = config_.repeat_penalty};
  generation_service_ =
      std::make_unique<GenerationService>(std::move(ollama_client), generation_options);
}

IndexHandle RagPipeline::build_or_load_index() {
  return index_manager_->build_or_load();
}

IndexHandle RagPipeline::rebuild_index() {
  return index_manager_->rebuild();
}

RetrievalResult RagPipeline::retrieve(const std::string &query, int k) const {
  return retrieval_service_->retrieve(query, k);
}

std::string RagPipeline::generate(const std::string &query, const RetrievalResult &context) const {
  return generation_service_->generate(query, context);
}

}  // namespace docsage_core
