#pragma once

#include <gmock/gmock.h>

#include "docsage_core/llm/ollama_client.hpp"
#include "utilities_test.hpp"

namespace docsage_tests {

constexpr int MOCK_EMBEDDING_DIMENSION = 8;

/**
 * Mock class for OllamaClient to use in tests
 */
class MockOllamaClient : public docsage_core::OllamaClient {
 public:
  MockOllamaClient()
      : docsage_core::OllamaClient("http://localhost:11434", "test-embed", "test-generate", 5) {
    // Default behavior: a deterministic vector derived from each text
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault(testing::Invoke([](const std::vector<std::string>& texts) {
          std::vector<std::vector<float>> vectors;
          for (const auto& text : texts) {
            vectors.push_back(TestUtilities::create_test_vector(text, MOCK_EMBEDDING_DIMENSION));
          }
          return vectors;
        }));
    ON_CALL(*this, get_embedding(testing::_)).WillByDefault(testing::Invoke([](const std::string& text) {
      return TestUtilities::create_test_vector(text, MOCK_EMBEDDING_DIMENSION);
    }));
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string& text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings,
              (const std::vector<std::string>& texts_to_embed), (override));
  MOCK_METHOD(std::string, generate,
              (const std::string& prompt, const docsage_core::GenerationParameters& parameters),
              (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
  MOCK_METHOD(std::vector<std::string>, list_models, (), (override));
  MOCK_METHOD(bool, pull_model, (const std::string& model_name), (override));
};

}  // namespace docsage_tests
