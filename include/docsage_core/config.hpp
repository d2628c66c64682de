#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace docsage_core {

class ConfigError : public std::exception {
 public:
  explicit ConfigError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

inline constexpr const char *DEFAULT_SYSTEM_PROMPT =
    "You are a helpful assistant that answers questions using only the provided context. "
    "Cite the sources you rely on as [n]. If the context does not contain the answer, say "
    "that you don't know.";

class Config {
 public:
  // Paths
  std::string docs_dir;
  std::string index_path;

  // Oracles
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  std::string generation_model;
  int oracle_timeout_seconds;
  bool pull_missing_models;

  // Chunking
  int chunk_size;
  int chunk_overlap;

  // Embedding throughput
  int embedding_batch_size;
  int embedding_parallelism;
  int embedding_max_retries;

  // Retrieval
  int top_k;
  std::string search_mode;
  int hnsw_m;
  int hnsw_ef_search;

  // Generation
  double temperature;
  int max_output_tokens;
  int context_window;
  double repeat_penalty;
  int max_context_chars;
  std::string system_prompt;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                        "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw ConfigError("Configuration root must be a JSON object");
    }

    Config config;
    try {
      config.docs_dir = json_config.value("docs_dir", std::string("training-data"));
      config.index_path = json_config.value("index_path", std::string("data/index/index.db"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.embedding_dimension = json_config.value("embedding_dimension", 0);
      config.generation_model = json_config.value("generation_model", std::string("qwen3:1.7b"));
      config.oracle_timeout_seconds = json_config.value("oracle_timeout_seconds", 300);
      config.pull_missing_models = json_config.value("pull_missing_models", false);

      config.chunk_size = json_config.value("chunk_size", 500);
      config.chunk_overlap = json_config.value("chunk_overlap", 50);

      config.embedding_batch_size = json_config.value("embedding_batch_size", 16);
      config.embedding_parallelism = json_config.value("embedding_parallelism", 1);
      config.embedding_max_retries = json_config.value("embedding_max_retries", 2);

      config.top_k = json_config.value("top_k", 5);
      config.search_mode = json_config.value("search_mode", std::string("exact"));
      config.hnsw_m = json_config.value("hnsw_m", 32);
      config.hnsw_ef_search = json_config.value("hnsw_ef_search", 64);

      config.temperature = json_config.value("temperature", 0.1);
      config.max_output_tokens = json_config.value("max_output_tokens", 1024);
      config.context_window = json_config.value("context_window", 4096);
      config.repeat_penalty = json_config.value("repeat_penalty", 1.1);
      config.max_context_chars = json_config.value("max_context_chars", 12000);
      config.system_prompt =
          json_config.value("system_prompt", std::string(DEFAULT_SYSTEM_PROMPT));
    } catch (const nlohmann::json::type_error &e) {
      // value() throws when a key is present with the wrong type
      throw ConfigError(std::string("Invalid configuration value type: ") + e.what());
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (docs_dir.empty()) {
      throw ConfigError("docs_dir cannot be empty");
    }
    if (index_path.empty()) {
      throw ConfigError("index_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw ConfigError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigError("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw ConfigError("generation_model cannot be empty");
    }
    if (embedding_dimension < 0) {
      throw ConfigError("embedding_dimension cannot be negative");
    }
    if (oracle_timeout_seconds <= 0) {
      throw ConfigError("oracle_timeout_seconds must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw ConfigError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0) {
      throw ConfigError("chunk_overlap cannot be negative");
    }
    if (chunk_overlap >= chunk_size) {
      throw ConfigError("chunk_overlap (" + std::to_string(chunk_overlap) +
                        ") must be smaller than chunk_size (" + std::to_string(chunk_size) +
                        ")");
    }
    if (embedding_batch_size <= 0) {
      throw ConfigError("embedding_batch_size must be greater than 0");
    }
    if (embedding_parallelism <= 0) {
      throw ConfigError("embedding_parallelism must be greater than 0");
    }
    if (embedding_max_retries < 0) {
      throw ConfigError("embedding_max_retries cannot be negative");
    }
    if (top_k <= 0) {
      throw ConfigError("top_k must be greater than 0");
    }
    if (search_mode != "exact" && search_mode != "hnsw") {
      throw ConfigError("search_mode must be either \"exact\" or \"hnsw\", got \"" +
                        search_mode + "\"");
    }
    if (hnsw_m < 2) {
      throw ConfigError("hnsw_m must be at least 2");
    }
    if (hnsw_ef_search <= 0) {
      throw ConfigError("hnsw_ef_search must be greater than 0");
    }
    if (temperature < 0.0) {
      throw ConfigError("temperature cannot be negative");
    }
    if (max_output_tokens <= 0) {
      throw ConfigError("max_output_tokens must be greater than 0");
    }
    if (context_window <= 0) {
      throw ConfigError("context_window must be greater than 0");
    }
    if (repeat_penalty <= 0.0) {
      throw ConfigError("repeat_penalty must be greater than 0");
    }
    if (max_context_chars <= 0) {
      throw ConfigError("max_context_chars must be greater than 0");
    }
  }
};

}  // namespace docsage_core
