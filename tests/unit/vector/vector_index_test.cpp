#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "rag_core/vector/index_metadata.hpp"
#include "rag_core/vector/npy_io.hpp"
#include "rag_core/vector/vector_index.hpp"
#include "utilities_test.hpp"

namespace rag_core {

class VectorIndexTest : public ::testing::TestWithParam<VectorBackendKind> {
 protected:
  void SetUp() override {
    root_ = rag_tests::TestUtilities::create_temp_dir("rag_vector_index");
  }

  void TearDown() override {
    rag_tests::TestUtilities::cleanup_temp_dir(root_);
  }

  VectorIndex open(const std::string& chatbot_id = "bot-1", size_t dimension = 3) {
    return VectorIndex(root_, chatbot_id, dimension, GetParam());
  }

  std::filesystem::path root_;
};

TEST_P(VectorIndexTest, RanksByInnerProduct) {
  auto index = open();
  index.add({{1, 0, 0}, {0, 1, 0}}, {"A", "B"});

  auto hits = index.search({0.9f, 0.1f, 0.0f}, 2);

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "A");
  EXPECT_EQ(hits[1].chunk_id, "B");
  EXPECT_GT(hits[0].score, hits[1].score);
  EXPECT_NEAR(hits[0].score, 0.9f, 1e-5);
  EXPECT_NEAR(hits[1].score, 0.1f, 1e-5);
}

TEST_P(VectorIndexTest, TopKLimitsAndFewerVectorsThanK) {
  auto index = open();
  index.add({{1, 0, 0}, {0, 1, 0}, {0, 0, 1}}, {"A", "B", "C"});

  EXPECT_EQ(index.search({0, 0, 1}, 1).size(), 1u);
  EXPECT_EQ(index.search({0, 0, 1}, 1)[0].chunk_id, "C");
  EXPECT_EQ(index.search({0, 0, 1}, 10).size(), 3u);
}

TEST_P(VectorIndexTest, NonPositiveTopKReturnsEmpty) {
  auto index = open();
  index.add({{1, 0, 0}}, {"A"});

  EXPECT_TRUE(index.search({1, 0, 0}, 0).empty());
  EXPECT_TRUE(index.search({1, 0, 0}, -4).empty());
}

TEST_P(VectorIndexTest, EmptyIndexReturnsEmpty) {
  auto index = open();

  EXPECT_EQ(index.size(), 0u);
  EXPECT_TRUE(index.search({1, 0, 0}, 5).empty());
}

TEST_P(VectorIndexTest, TiesKeepStorageOrder) {
  auto index = open();
  index.add({{0, 1, 0}, {1, 0, 0}, {1, 0, 0}, {1, 0, 0}}, {"W", "X", "Y", "Z"});

  auto hits = index.search({1, 0, 0}, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk_id, "X");
  EXPECT_EQ(hits[1].chunk_id, "Y");
  EXPECT_EQ(hits[2].chunk_id, "Z");
}

TEST_P(VectorIndexTest, LongTieRunAtTheCutKeepsStorageOrder) {
  auto index = open();
  std::vector<std::vector<float>> vectors;
  std::vector<std::string> ids;
  for (int i = 0; i < 60; ++i) {
    // every third row scores lower; the rest tie
    vectors.push_back(i % 3 == 0 ? std::vector<float>{0, 1, 0} : std::vector<float>{1, 0, 0});
    ids.push_back("row-" + std::to_string(i));
  }
  index.add(vectors, ids);

  auto hits = index.search({1, 0, 0}, 4);

  ASSERT_EQ(hits.size(), 4u);
  EXPECT_EQ(hits[0].chunk_id, "row-1");
  EXPECT_EQ(hits[1].chunk_id, "row-2");
  EXPECT_EQ(hits[2].chunk_id, "row-4");
  EXPECT_EQ(hits[3].chunk_id, "row-5");
}

TEST_P(VectorIndexTest, TopKSmallerThanIndexReturnsBestRows) {
  auto index = open();
  std::vector<std::vector<float>> vectors;
  std::vector<std::string> ids;
  for (int i = 0; i < 40; ++i) {
    vectors.push_back({static_cast<float>(i) / 40.0f, 0, 1});
    ids.push_back("row-" + std::to_string(i));
  }
  index.add(vectors, ids);

  auto hits = index.search({1, 0, 0}, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].chunk_id, "row-39");
  EXPECT_EQ(hits[1].chunk_id, "row-38");
  EXPECT_EQ(hits[2].chunk_id, "row-37");
}

TEST_P(VectorIndexTest, WrongWidthBatchIsRejectedAndStateUnchanged) {
  auto index = open();
  index.add({{1, 0, 0}}, {"A"});

  EXPECT_THROW(index.add({{0, 1, 0}, {0, 1}}, {"B", "C"}), DimensionMismatchError);
  EXPECT_EQ(index.size(), 1u);

  auto reopened = open();
  EXPECT_EQ(reopened.size(), 1u);
  EXPECT_EQ(reopened.chunk_ids(), std::vector<std::string>{"A"});
}

TEST_P(VectorIndexTest, WrongWidthQueryIsRejected) {
  auto index = open();
  index.add({{1, 0, 0}}, {"A"});

  try {
    index.search({1, 0}, 1);
    FAIL() << "Expected DimensionMismatchError";
  } catch (const DimensionMismatchError& e) {
    EXPECT_EQ(e.expected(), 3u);
    EXPECT_EQ(e.actual(), 2u);
  }
}

TEST_P(VectorIndexTest, MismatchedIdCountIsRejected) {
  auto index = open();
  EXPECT_THROW(index.add({{1, 0, 0}}, {"A", "B"}), VectorIndexError);
  EXPECT_EQ(index.size(), 0u);
}

TEST_P(VectorIndexTest, ReopenReproducesSearchResults) {
  std::vector<IndexSearchHit> before;
  {
    auto index = open();
    index.add({{1, 0, 0}, {0.5f, 0.5f, 0}}, {"A", "B"});
    index.add({{0, 0, 1}}, {"C"});
    before = index.search({0.6f, 0.3f, 0.1f}, 3);
  }

  auto reopened = open();
  auto after = reopened.search({0.6f, 0.3f, 0.1f}, 3);

  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].chunk_id, after[i].chunk_id);
    EXPECT_FLOAT_EQ(before[i].score, after[i].score);
  }
  EXPECT_EQ(reopened.chunk_ids(), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_P(VectorIndexTest, PersistedDimensionOverridesRequested) {
  {
    auto index = open("bot-1", 3);
    index.add({{1, 0, 0}}, {"A"});
  }

  auto reopened = open("bot-1", 8);

  EXPECT_EQ(reopened.dimension(), 3u);
  EXPECT_THROW(reopened.add({std::vector<float>(8, 0.1f)}, {"B"}), DimensionMismatchError);
}

TEST_P(VectorIndexTest, ChatbotsAreIsolated) {
  auto first = open("bot-1");
  auto second = open("bot-2");
  first.add({{1, 0, 0}}, {"A"});
  second.add({{0, 1, 0}}, {"B"});

  auto hits = open("bot-1").search({0, 1, 0}, 5);

  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, "A");
}

TEST_P(VectorIndexTest, SecondInstanceSeesEarlierAppend) {
  auto writer_one = open();
  auto writer_two = open();
  writer_one.add({{1, 0, 0}}, {"A"});
  // writer_two loaded before the first append; add() re-reads under the lock
  writer_two.add({{0, 1, 0}}, {"B"});

  auto reopened = open();
  EXPECT_EQ(reopened.chunk_ids(), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(reopened.search({0, 1, 0}, 1)[0].chunk_id, "B");
}

TEST_P(VectorIndexTest, CountMismatchIsReportedAsCorruption) {
  {
    auto index = open();
    index.add({{1, 0, 0}, {0, 1, 0}}, {"A", "B"});
  }
  write_index_metadata(root_ / "bot-1.json", IndexMetadata{{"A", "B", "C"}, 3});

  auto reopened = open();

  EXPECT_THROW(reopened.search({1, 0, 0}, 2), IndexCorruptionError);
  EXPECT_THROW(reopened.add({{0, 0, 1}}, {"D"}), IndexCorruptionError);
}

TEST_P(VectorIndexTest, FailedBlobSwapKeepsCommittedState) {
  namespace fs = std::filesystem;
  auto index = open();
  index.add({{1, 0, 0}, {0, 1, 0}}, {"A", "B"});

  const fs::path blob = root_ / (std::string("bot-1") + blob_extension(GetParam()));
  // a non-empty directory where the committed blob is set aside makes the swap fail
  const fs::path previous = fs::path(blob.string() + ".prev");
  fs::create_directories(previous);
  rag_tests::TestUtilities::write_file(previous / "occupied", "x");

  EXPECT_THROW(index.add({{0, 0, 1}}, {"C"}), VectorIndexError);

  EXPECT_EQ(index.chunk_ids(), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(index.search({0, 1, 0}, 1)[0].chunk_id, "B");
  EXPECT_FALSE(fs::exists(blob.string() + ".tmp"));
  EXPECT_FALSE(fs::exists(root_ / "bot-1.json.tmp"));

  auto reopened = open();
  EXPECT_EQ(reopened.chunk_ids(), (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(reopened.size(), 2u);
}

TEST_P(VectorIndexTest, InterruptedWriteFallsBackToPreviousBlob) {
  namespace fs = std::filesystem;
  const fs::path blob = root_ / (std::string("bot-1") + blob_extension(GetParam()));
  const fs::path metadata = root_ / "bot-1.json";
  const fs::path saved_blob = root_ / "saved.blob";
  const fs::path saved_metadata = root_ / "saved.json";
  {
    auto index = open();
    index.add({{1, 0, 0}, {0, 1, 0}}, {"A", "B"});
  }
  fs::copy_file(blob, saved_blob);
  fs::copy_file(metadata, saved_metadata);
  {
    auto index = open();
    index.add({{0, 0, 1}}, {"C"});
  }
  // new blob in place, earlier blob set aside, metadata still describing the earlier rows
  fs::copy_file(saved_blob, fs::path(blob.string() + ".prev"));
  fs::copy_file(saved_metadata, metadata, fs::copy_options::overwrite_existing);

  auto reopened = open();
  EXPECT_EQ(reopened.size(), 2u);
  EXPECT_EQ(reopened.search({0, 1, 0}, 1)[0].chunk_id, "B");

  reopened.add({{0, 0, 1}}, {"D"});
  EXPECT_EQ(reopened.chunk_ids(), (std::vector<std::string>{"A", "B", "D"}));
  EXPECT_FALSE(fs::exists(blob.string() + ".prev"));
  EXPECT_EQ(open().search({0, 0, 1}, 1)[0].chunk_id, "D");
}

TEST_P(VectorIndexTest, ReloadPicksUpNewRows) {
  auto reader = open();
  auto writer = open();
  writer.add({{1, 0, 0}}, {"A"});

  EXPECT_EQ(reader.size(), 0u);
  reader.reload();
  EXPECT_EQ(reader.size(), 1u);
}

TEST_P(VectorIndexTest, RemoveDeletesArtifacts) {
  {
    auto index = open();
    index.add({{1, 0, 0}}, {"A"});
  }
  EXPECT_TRUE(std::filesystem::exists(root_ / "bot-1.json"));

  VectorIndex::remove(root_, "bot-1");

  EXPECT_FALSE(std::filesystem::exists(root_ / "bot-1.json"));
  EXPECT_FALSE(std::filesystem::exists(root_ / "bot-1.faiss"));
  EXPECT_FALSE(std::filesystem::exists(root_ / "bot-1.npy"));
  EXPECT_EQ(open().size(), 0u);
}

TEST_P(VectorIndexTest, RejectsPathLikeChatbotIds) {
  EXPECT_THROW(open("../escape"), VectorIndexError);
  EXPECT_THROW(open("a/b"), VectorIndexError);
  EXPECT_THROW(open(".."), VectorIndexError);
  EXPECT_THROW(open(""), VectorIndexError);
}

INSTANTIATE_TEST_SUITE_P(Backends, VectorIndexTest,
                         ::testing::Values(VectorBackendKind::Faiss, VectorBackendKind::Matrix),
                         [](const ::testing::TestParamInfo<VectorBackendKind>& info) {
                           return std::string(to_string(info.param));
                         });

class VectorIndexInterchangeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = rag_tests::TestUtilities::create_temp_dir("rag_vector_interchange");
  }

  void TearDown() override {
    rag_tests::TestUtilities::cleanup_temp_dir(root_);
  }

  std::filesystem::path root_;
};

TEST_F(VectorIndexInterchangeTest, MatrixStoreIsReadableByFaissBackend) {
  {
    VectorIndex matrix(root_, "bot", 3, VectorBackendKind::Matrix);
    matrix.add({{1, 0, 0}, {0, 1, 0}}, {"A", "B"});
  }
  EXPECT_TRUE(std::filesystem::exists(root_ / "bot.npy"));

  VectorIndex faiss(root_, "bot", 3, VectorBackendKind::Faiss);
  auto hits = faiss.search({0.2f, 0.8f, 0}, 2);

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, "B");
  EXPECT_EQ(hits[1].chunk_id, "A");

  faiss.add({{0, 0, 1}}, {"C"});
  EXPECT_TRUE(std::filesystem::exists(root_ / "bot.faiss"));
  EXPECT_FALSE(std::filesystem::exists(root_ / "bot.npy"));
}

TEST_F(VectorIndexInterchangeTest, FaissStoreIsReadableByMatrixBackend) {
  {
    VectorIndex faiss(root_, "bot", 2, VectorBackendKind::Faiss);
    faiss.add({{1, 0}, {0, 1}}, {"A", "B"});
  }

  VectorIndex matrix(root_, "bot", 2, VectorBackendKind::Matrix);

  EXPECT_EQ(matrix.size(), 2u);
  EXPECT_EQ(matrix.search({1, 0}, 1)[0].chunk_id, "A");
}

TEST_F(VectorIndexInterchangeTest, MetadataFormatIsSharedJson) {
  {
    VectorIndex matrix(root_, "bot", 2, VectorBackendKind::Matrix);
    matrix.add({{1, 0}}, {"A"});
  }

  auto metadata = read_index_metadata(root_ / "bot.json");
  ASSERT_TRUE(metadata.has_value());
  EXPECT_EQ(metadata->dimension, 2u);
  EXPECT_EQ(metadata->chunk_ids, std::vector<std::string>{"A"});

  NpyMatrix rows = read_npy_matrix(root_ / "bot.npy");
  EXPECT_EQ(rows.rows, 1u);
  EXPECT_EQ(rows.cols, 2u);
}

TEST(VectorBackendKindTest, ParsesNames) {
  EXPECT_EQ(vector_backend_from_string("faiss"), VectorBackendKind::Faiss);
  EXPECT_EQ(vector_backend_from_string("matrix"), VectorBackendKind::Matrix);
  EXPECT_THROW(vector_backend_from_string("hnsw"), VectorIndexError);
}

TEST(RankHitsTest, OrdersByScoreThenRow) {
  std::vector<BackendHit> hits = {{0, 0.5f}, {1, 0.9f}, {2, 0.5f}, {3, 0.1f}};

  rank_hits(hits, 3);

  ASSERT_EQ(hits.size(), 3u);
  EXPECT_EQ(hits[0].row, 1u);
  EXPECT_EQ(hits[1].row, 0u);
  EXPECT_EQ(hits[2].row, 2u);
}

}  // namespace rag_core
