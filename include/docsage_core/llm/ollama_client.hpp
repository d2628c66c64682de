#pragma once

#include <string>
#include <vector>

namespace docsage_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Sampling options forwarded to the generate endpoint
struct GenerationParameters {
  double temperature = 0.1;
  int max_output_tokens = 1024;  // num_predict
  int context_window = 4096;     // num_ctx
  double repeat_penalty = 1.1;
};

/**
 * @class OllamaClient
 * @brief Thin wrapper over ollama-hpp for the embedding and generation models.
 *
 * The server URL and the read/write timeouts are process-wide settings in
 * ollama-hpp; they are applied once in the constructor. No request is made
 * until a method is called.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               int timeout_seconds);
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // Get embedding for text
  virtual std::vector<float> get_embedding(const std::string &text);

  // One vector per input, in input order. Each text is sent as its own
  // /api/embed request, so a batch here groups texts for the Embedder's
  // retries and worker scheduling, not into a single HTTP round trip.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts_to_embed);

  // Single non-streaming completion; the response text is returned as is
  virtual std::string generate(const std::string &prompt, const GenerationParameters &parameters);

  virtual bool is_server_available();
  virtual std::vector<std::string> list_models();
  virtual bool pull_model(const std::string &model_name);

  const std::string &ollama_url() const { return ollama_url_; }
  const std::string &embedding_model() const { return embedding_model_; }
  const std::string &generation_model() const { return generation_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  int timeout_seconds_;

  void setup_server_connection();
};

}  // namespace docsage_core
