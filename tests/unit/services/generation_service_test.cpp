#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/mocks_test.hpp"
#include "docsage_core/services/generation_service.hpp"

using ::testing::_;
using ::testing::AllOf;
using ::testing::DoubleEq;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace docsage_core {

namespace {

RetrievedChunk make_chunk(const std::string& source, const std::string& content,
                          const std::string& filename = "") {
  RetrievedChunk chunk;
  chunk.id = "id-" + source;
  chunk.source = source;
  chunk.content = content;
  if (!filename.empty()) {
    chunk.metadata["filename"] = filename;
  }
  chunk.score = 0.9f;
  return chunk;
}

}  // namespace

class GenerationServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_client_ = std::make_shared<NiceMock<docsage_tests::MockOllamaClient>>();
  }

  GenerationService make_service(size_t max_context_chars = 12000) {
    GenerationOptions options;
    options.system_prompt = "SYS";
    options.max_context_chars = max_context_chars;
    return GenerationService(mock_client_, options);
  }

  std::shared_ptr<NiceMock<docsage_tests::MockOllamaClient>> mock_client_;
};

TEST_F(GenerationServiceTest, PromptListsContextInRankOrder) {
  auto service = make_service();
  RetrievalResult context = {make_chunk("docs/a.txt", "Alpha", "a.txt"),
                             make_chunk("docs/b.md", "Beta")};

  EXPECT_EQ(service.build_prompt("Q?", context),
            "SYS\n\nContext:\n"
            "[1] a.txt (docs/a.txt)\nAlpha\n\n"
            "[2] b.md (docs/b.md)\nBeta\n\n"
            "Question: Q?\nAnswer:");
}

TEST_F(GenerationServiceTest, EmptyContextIsStated) {
  auto service = make_service();

  EXPECT_EQ(service.build_prompt("Q?", {}),
            "SYS\n\nContext:\nNo relevant context was found.\n\nQuestion: Q?\nAnswer:");
}

TEST_F(GenerationServiceTest, BlocksBeyondBudgetAreDropped) {
  // "[1] a.txt (docs/a.txt)\nAlpha" is 28 bytes, the second block 25
  auto service = make_service(40);
  RetrievalResult context = {make_chunk("docs/a.txt", "Alpha", "a.txt"),
                             make_chunk("docs/b.md", "Beta")};

  const std::string prompt = service.build_prompt("Q?", context);

  EXPECT_THAT(prompt, HasSubstr("[1] a.txt (docs/a.txt)\nAlpha\n\nQuestion: Q?"));
  EXPECT_THAT(prompt, ::testing::Not(HasSubstr("[2]")));
}

TEST_F(GenerationServiceTest, OversizedFirstBlockIsTruncated) {
  auto service = make_service(10);
  RetrievalResult context = {make_chunk("docs/a.txt", "Alpha", "a.txt")};

  EXPECT_EQ(service.build_prompt("Q?", context),
            "SYS\n\nContext:\n[1] a.txt \n\nQuestion: Q?\nAnswer:");
}

TEST_F(GenerationServiceTest, TruncationDoesNotSplitUtf8) {
  // "[1] x (x)\n" is 10 bytes, followed by two 2-byte characters
  auto service = make_service(11);
  RetrievalResult context = {make_chunk("x", "\xC3\xA9\xC3\xA9", "x")};

  EXPECT_EQ(service.build_prompt("q", context),
            "SYS\n\nContext:\n[1] x (x)\n\n\nQuestion: q\nAnswer:");
}

TEST_F(GenerationServiceTest, GenerateForwardsPromptAndParameters) {
  GenerationOptions options;
  options.system_prompt = "SYS";
  options.parameters.temperature = 0.5;
  options.parameters.max_output_tokens = 256;
  options.parameters.context_window = 8192;
  options.parameters.repeat_penalty = 1.3;
  GenerationService service(mock_client_, options);

  EXPECT_CALL(*mock_client_,
              generate(AllOf(HasSubstr("[1] a.txt (docs/a.txt)\nAlpha"),
                             HasSubstr("Question: What is alpha?")),
                       AllOf(Field(&GenerationParameters::temperature, DoubleEq(0.5)),
                             Field(&GenerationParameters::max_output_tokens, 256),
                             Field(&GenerationParameters::context_window, 8192),
                             Field(&GenerationParameters::repeat_penalty, DoubleEq(1.3)))))
      .WillOnce(Return("Alpha is the first letter [1]."));

  EXPECT_EQ(service.generate("What is alpha?", {make_chunk("docs/a.txt", "Alpha", "a.txt")}),
            "Alpha is the first letter [1].");
}

TEST_F(GenerationServiceTest, GenerateRunsWithoutContext) {
  auto service = make_service();
  EXPECT_CALL(*mock_client_, generate(HasSubstr("No relevant context was found."), _))
      .WillOnce(Return("I don't know."));

  EXPECT_EQ(service.generate("Anything?", {}), "I don't know.");
}

TEST_F(GenerationServiceTest, ModelFailureIsGenerationError) {
  auto service = make_service();
  EXPECT_CALL(*mock_client_, generate(_, _)).WillOnce(Throw(OllamaError("timed out")));

  try {
    service.generate("Q?", {});
    FAIL() << "Expected GenerationError";
  } catch (const GenerationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("timed out"));
  }
}

TEST_F(GenerationServiceTest, EmptyAnswerIsGenerationError) {
  auto service = make_service();
  EXPECT_CALL(*mock_client_, generate(_, _)).WillOnce(Return(""));

  EXPECT_THROW(service.generate("Q?", {}), GenerationError);
}

}  // namespace docsage_core
