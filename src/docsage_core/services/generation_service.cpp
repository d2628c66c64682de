#include "docsage_core/services/generation_service.hpp"

#include <filesystem>
#include <sstream>

namespace docsage_core {

namespace {

// Cuts at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

}  // namespace

GenerationService::GenerationService(std::shared_ptr<OllamaClient> ollama_client,
                                     GenerationOptions options)
    : ollama_client_(std::move(ollama_client)), options_(std::move(options)) {}

std::string GenerationService::format_block(size_t number, const RetrievedChunk &chunk) {
  std::string filename;
  if (chunk.metadata.contains("filename") && chunk.metadata["filename"].is_string()) {
    filename = chunk.metadata["filename"].get<std::string>();
  } else {
    filename = std::filesystem::path(chunk.source).filename().string();
  }

  return "[" + std::to_string(number) + "] " + filename + " (" + chunk.source + ")\n" +
         chunk.content;
}

std::string GenerationService::build_prompt(const std::string &query,
                                            const RetrievalResult &context) const {
  std::stringstream prompt;
  prompt << options_.system_prompt << "\n\n";
  prompt << "Context:\n";

  size_t used = 0;
  size_t included = 0;
  for (size_t i = 0; i < context.size(); ++i) {
    std::string block = format_block(i + 1, context[i]);
    if (used + block.size() > options_.max_context_chars) {
      if (included > 0) {
        break;
      }
      block = truncate_utf8(block, options_.max_context_chars);
    }

    if (included > 0) {
      prompt << "\n\n";
    }
    prompt << block;
    used += block.size();
    ++included;
  }

  if (included == 0) {
    prompt << "No relevant context was found.";
  }

  prompt << "\n\nQuestion: " << query << "\nAnswer:";
  return prompt.str();
}

std::string GenerationService::generate(const std::string &query,
                                        const RetrievalResult &context) const {
  const std::string prompt = build_prompt(query, context);

  std::string answer;
  try {
    answer = ollama_client_->generate(prompt, options_.parameters);
  } catch (const OllamaError &e) {
    throw GenerationError(e.what());
  }

  if (answer.empty()) {
    throw GenerationError("Generation model returned no text");
  }
  return answer;
}

}  // namespace docsage_core
