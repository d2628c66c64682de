#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "docsage_core/config.hpp"
#include "docsage_core/llm/ollama_client.hpp"
#include "docsage_core/types/retrieval.hpp"

namespace docsage_core {

class GenerationError : public std::exception {
 public:
  explicit GenerationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct GenerationOptions {
  std::string system_prompt = DEFAULT_SYSTEM_PROMPT;
  size_t max_context_chars = 12000;
  GenerationParameters parameters;
};

/**
 * @class GenerationService
 * @brief Answers a question from retrieved chunks with one call to the generation model.
 *
 * The prompt is the system instruction, the numbered context blocks in rank
 * order, then the question. Blocks are added while they fit in
 * `max_context_chars`; the first block is always present, cut to the budget
 * if it is too long on its own. There is no retry and no conversation memory.
 */
class GenerationService {
 public:
  GenerationService(std::shared_ptr<OllamaClient> ollama_client, GenerationOptions options);

  // Throws GenerationError when the model fails, times out or returns nothing
  std::string generate(const std::string &query, const RetrievalResult &context) const;

  std::string build_prompt(const std::string &query, const RetrievalResult &context) const;

 private:
  std::shared_ptr<OllamaClient> ollama_client_;
  GenerationOptions options_;

  static std::string format_block(size_t number, const RetrievedChunk &chunk);
};

}  // namespace docsage_core
