#include "docsage_core/llm/ollama_client.hpp"
#include "ollama.hpp"

namespace docsage_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model),
      timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  // A call that exceeds the timeout surfaces as an ollama::exception
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);

    auto json_response = response.as_json();

    // /api/embed answers with "embeddings", the legacy endpoint with "embedding"
    nlohmann::json embeddings;
    if (json_response.contains("embeddings")) {
      embeddings = json_response["embeddings"];
    } else if (json_response.contains("embedding")) {
      embeddings = json_response["embedding"];
    } else {
      throw OllamaError("Response does not contain embedding field");
    }

    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (!embeddings.empty() && embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts_to_embed) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts_to_embed.size());
  // ollama::generate_embeddings takes a single input string
  for (const auto &text : texts_to_embed) {
    embeddings.push_back(get_embedding(text));
  }
  return embeddings;
}

std::string OllamaClient::generate(const std::string &prompt,
                                   const GenerationParameters &parameters) {
  try {
    ollama::options options;
    options["temperature"] = parameters.temperature;
    options["num_predict"] = parameters.max_output_tokens;
    options["num_ctx"] = parameters.context_window;
    options["repeat_penalty"] = parameters.repeat_penalty;

    ollama::response response = ollama::generate(generation_model_, prompt, options);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

std::vector<std::string> OllamaClient::list_models() {
  try {
    return ollama::list_models();
  } catch (const ollama::exception &e) {
    throw OllamaError("Listing models failed: " + std::string(e.what()));
  }
}

bool OllamaClient::pull_model(const std::string &model_name) {
  try {
    return ollama::pull_model(model_name);
  } catch (const ollama::exception &e) {
    throw OllamaError("Pulling model " + model_name + " failed: " + std::string(e.what()));
  }
}

}  // namespace docsage_core
