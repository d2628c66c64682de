#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/mocks_test.hpp"
#include "docsage_core/services/retrieval_service.hpp"

using ::testing::_;
using ::testing::NiceMock;

namespace docsage_core {

class RetrievalServiceTest : public docsage_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    std::filesystem::create_directories(temp_dir_ / "docs");
    mock_client_ = std::make_shared<NiceMock<docsage_tests::MockOllamaClient>>();

    EmbedderOptions options;
    options.retry_backoff = std::chrono::milliseconds(0);
    embedder_ = std::make_shared<Embedder>(mock_client_, options);

    auto builder = std::make_shared<IndexBuilder>(
        std::make_shared<SourceLoader>(std::make_shared<ContentExtractorFactory>()),
        Chunker(1000, 0), embedder_, "test-embed", SearchOptions{});
    index_manager_ = std::make_shared<IndexManager>(
        builder, std::make_shared<IndexStore>(temp_dir_ / "index.db"), temp_dir_ / "docs");
    service_ = std::make_unique<RetrievalService>(embedder_, index_manager_);
  }

  std::shared_ptr<NiceMock<docsage_tests::MockOllamaClient>> mock_client_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<IndexManager> index_manager_;
  std::unique_ptr<RetrievalService> service_;
};

TEST_F(RetrievalServiceTest, NoIndexIsError) {
  EXPECT_THROW(service_->retrieve("anything", 3), VectorIndexError);
}

TEST_F(RetrievalServiceTest, EmptyIndexSkipsEmbedding) {
  index_manager_->build_or_load();

  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(0);
  EXPECT_TRUE(service_->retrieve("anything", 3).empty());
}

TEST_F(RetrievalServiceTest, NonPositiveKSkipsEmbedding) {
  write_file("docs/a.txt", "Some text");
  index_manager_->build_or_load();

  EXPECT_CALL(*mock_client_, get_embeddings(_)).Times(0);
  EXPECT_TRUE(service_->retrieve("Some text", 0).empty());
  EXPECT_TRUE(service_->retrieve("Some text", -1).empty());
}

TEST_F(RetrievalServiceTest, MatchingTextRanksFirst) {
  write_file("docs/a.txt", "Alpha document");
  write_file("docs/b.txt", "Beta document");
  write_file("docs/c.txt", "Gamma document");
  index_manager_->build_or_load();

  // The mock embeds identical text to identical vectors
  auto results = service_->retrieve("Beta document", 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].source, (temp_dir_ / "docs" / "b.txt").generic_string());
  EXPECT_EQ(results[0].content, "Beta document");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  EXPECT_GE(results[0].score, results[1].score);
}

TEST_F(RetrievalServiceTest, KIsCappedAtIndexSize) {
  write_file("docs/a.txt", "Alpha document");
  write_file("docs/b.txt", "Beta document");
  index_manager_->build_or_load();

  EXPECT_EQ(service_->retrieve("document", 10).size(), 2u);
}

}  // namespace docsage_core
