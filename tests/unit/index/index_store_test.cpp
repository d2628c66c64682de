#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sqlite_modern_cpp.h>

#include "common/utilities_test.hpp"
#include "docsage_core/index/index_store.hpp"

namespace docsage_core {

class IndexStoreTest : public docsage_tests::TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    index_path_ = temp_dir_ / "data" / "index.db";
    store_ = std::make_unique<IndexStore>(index_path_);
  }

  static IndexFingerprint fingerprint(size_t dimension = 3) {
    return {.embedding_model = "test-embed",
            .dimension = dimension,
            .chunk_size = 200,
            .chunk_overlap = 20};
  }

  static VectorIndex make_index() {
    auto entries = docsage_tests::TestUtilities::create_test_entries(
        {{1.0f, 0.0f, 0.0f}, {0.0f, 2.0f, 0.0f}, {0.5f, 0.5f, 0.5f}});
    entries[1].chunk.content = "Gr\xC3\xBC\xC3\x9F" "e aus K\xC3\xB6ln \xE2\x9C\x93";
    entries[1].chunk.chunk_index = 4;
    entries[1].chunk.start_offset = 120;
    entries[1].chunk.end_offset = 131;
    entries[2].chunk.metadata = {{"title", "Third"}, {"tags", {"a", "b"}}};
    return VectorIndex(fingerprint(), std::move(entries));
  }

  void tamper(const std::string& statement) {
    sqlite::database db(index_path_.string());
    db << statement;
  }

  std::filesystem::path index_path_;
  std::unique_ptr<IndexStore> store_;
};

TEST_F(IndexStoreTest, SaveAndLoadPreservesEntries) {
  auto original = make_index();
  store_->save(original);

  ASSERT_TRUE(store_->exists());
  auto loaded = store_->load(fingerprint(), SearchOptions{});

  EXPECT_EQ(loaded->fingerprint(), original.fingerprint());
  ASSERT_EQ(loaded->size(), original.size());
  for (size_t i = 0; i < original.size(); ++i) {
    const auto& expected = original.entries()[i];
    const auto& actual = loaded->entries()[i];
    EXPECT_EQ(actual.id, expected.id);
    EXPECT_EQ(actual.chunk.content, expected.chunk.content);
    EXPECT_EQ(actual.chunk.source, expected.chunk.source);
    EXPECT_EQ(actual.chunk.chunk_index, expected.chunk.chunk_index);
    EXPECT_EQ(actual.chunk.start_offset, expected.chunk.start_offset);
    EXPECT_EQ(actual.chunk.end_offset, expected.chunk.end_offset);
    EXPECT_EQ(actual.chunk.metadata, expected.chunk.metadata);
    EXPECT_EQ(actual.vector_embedding, expected.vector_embedding);
  }
}

TEST_F(IndexStoreTest, LoadedIndexAnswersQueriesLikeOriginal) {
  auto original = make_index();
  store_->save(original);
  auto loaded = store_->load(fingerprint(), SearchOptions{});

  const std::vector<float> query = {0.2f, 0.9f, 0.1f};
  auto expected = original.query(query, 3);
  auto actual = loaded->query(query, 3);

  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(actual[i].id, expected[i].id);
    EXPECT_FLOAT_EQ(actual[i].score, expected[i].score);
  }
}

TEST_F(IndexStoreTest, SaveLeavesNoTemporaryFile) {
  store_->save(make_index());

  EXPECT_TRUE(std::filesystem::exists(index_path_));
  EXPECT_FALSE(std::filesystem::exists(store_->temporary_path()));
}

TEST_F(IndexStoreTest, InvalidUtf8MetadataIsReplacedOnSave) {
  auto entries = docsage_tests::TestUtilities::create_test_entries({{1.0f, 0.0f, 0.0f}});
  entries[0].chunk.metadata = {{"filename", "caf\xE9.txt"}};
  VectorIndex index(fingerprint(), std::move(entries));

  ASSERT_NO_THROW(store_->save(index));
  EXPECT_FALSE(std::filesystem::exists(store_->temporary_path()));

  auto loaded = store_->load(fingerprint(), SearchOptions{});
  ASSERT_EQ(loaded->size(), 1u);
  EXPECT_EQ(loaded->entries()[0].chunk.metadata["filename"], "caf\xEF\xBF\xBD.txt");
}

TEST_F(IndexStoreTest, SaveReplacesPreviousArtifact) {
  store_->save(make_index());

  auto entries = docsage_tests::TestUtilities::create_test_entries({{0.0f, 0.0f, 1.0f}});
  entries[0].id = "replacement";
  store_->save(VectorIndex(fingerprint(), std::move(entries)));

  auto loaded = store_->load(fingerprint(), SearchOptions{});
  ASSERT_EQ(loaded->size(), 1u);
  EXPECT_EQ(loaded->entries()[0].id, "replacement");
}

TEST_F(IndexStoreTest, StaleTemporaryFileIsIgnored) {
  docsage_tests::TestUtilities::write_file(index_path_.parent_path(),
                                           store_->temporary_path().filename().string(),
                                           "leftover from a crash");

  store_->save(make_index());

  EXPECT_EQ(store_->load(fingerprint(), SearchOptions{})->size(), 3u);
  EXPECT_FALSE(std::filesystem::exists(store_->temporary_path()));
}

TEST_F(IndexStoreTest, EmptyIndexRoundTrips) {
  store_->save(VectorIndex(fingerprint(0), {}));

  auto loaded = store_->load(fingerprint(0), SearchOptions{});
  EXPECT_TRUE(loaded->empty());
  EXPECT_TRUE(loaded->query({1.0f, 0.0f, 0.0f}, 5).empty());
}

TEST_F(IndexStoreTest, ZeroExpectedDimensionAcceptsStoredDimension) {
  store_->save(make_index());

  auto loaded = store_->load(fingerprint(0), SearchOptions{});
  EXPECT_EQ(loaded->dimension(), 3u);
}

TEST_F(IndexStoreTest, LoadedIndexUsesRequestedSearchMode) {
  store_->save(make_index());

  auto loaded = store_->load(fingerprint(), SearchOptions{.mode = SearchMode::Hnsw});
  EXPECT_EQ(loaded->search_options().mode, SearchMode::Hnsw);
  EXPECT_EQ(loaded->query({1.0f, 0.0f, 0.0f}, 1)[0].id, "entry-0");
}

TEST_F(IndexStoreTest, MissingArtifactIsIntegrityError) {
  EXPECT_FALSE(store_->exists());
  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, GarbageArtifactIsIntegrityError) {
  docsage_tests::TestUtilities::write_file(index_path_.parent_path(), "index.db",
                                           std::string(4096, 'x'));
  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, EmptyFileIsIntegrityError) {
  docsage_tests::TestUtilities::write_file(index_path_.parent_path(), "index.db", "");
  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, FingerprintMismatchIsIntegrityError) {
  store_->save(make_index());

  auto other_model = fingerprint();
  other_model.embedding_model = "nomic-embed-text";
  EXPECT_THROW(store_->load(other_model, SearchOptions{}), IndexIntegrityError);

  auto other_size = fingerprint();
  other_size.chunk_size = 300;
  EXPECT_THROW(store_->load(other_size, SearchOptions{}), IndexIntegrityError);

  auto other_overlap = fingerprint();
  other_overlap.chunk_overlap = 0;
  EXPECT_THROW(store_->load(other_overlap, SearchOptions{}), IndexIntegrityError);

  EXPECT_THROW(store_->load(fingerprint(768), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, UnknownFormatVersionIsIntegrityError) {
  store_->save(make_index());
  tamper("UPDATE index_info SET value = '99' WHERE key = 'format_version';");

  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, EntryCountMismatchIsIntegrityError) {
  store_->save(make_index());
  tamper("DELETE FROM entries WHERE position = 2;");

  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, CorruptedContentIsIntegrityError) {
  store_->save(make_index());
  tamper("UPDATE entries SET content = X'00010203' WHERE position = 0;");

  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, TruncatedVectorIsIntegrityError) {
  store_->save(make_index());
  tamper("UPDATE entries SET vector = X'0000803F' WHERE position = 1;");

  EXPECT_THROW(store_->load(fingerprint(), SearchOptions{}), IndexIntegrityError);
}

TEST_F(IndexStoreTest, UnwritableLocationIsStoreError) {
  auto blocker = write_file("blocker", "not a directory");
  IndexStore store(blocker / "index.db");

  EXPECT_THROW(store.save(make_index()), IndexStoreError);
}

}  // namespace docsage_core
