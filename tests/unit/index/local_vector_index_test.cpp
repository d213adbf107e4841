#include "docqa_core/index/local_vector_index.hpp"

#include <gtest/gtest.h>

#include <thread>

#include "common/utilities_test.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_tests {

using docqa_core::LocalVectorIndex;
using docqa_core::SearchFilters;
using docqa_core::VectorEntry;

class LocalVectorIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<docqa_core::DatabaseManager>(temp_db_path_, "docqa_test_key", 4);
    index_ = std::make_unique<LocalVectorIndex>(*db_manager_, 3);
  }

  void TearDown() override {
    index_.reset();
    db_manager_->shutdown();
    db_manager_.reset();
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<docqa_core::DatabaseManager> db_manager_;
  std::unique_ptr<LocalVectorIndex> index_;
};

TEST_F(LocalVectorIndexTest, RejectsZeroDimension) {
  EXPECT_THROW(LocalVectorIndex(*db_manager_, 0), docqa_core::InvalidParametersError);
}

TEST_F(LocalVectorIndexTest, RejectsWrongDimensionOnAddAndSearch) {
  EXPECT_THROW(index_->add(1, 1, {1, 0}, {1, 0, ""}), docqa_core::InvalidParametersError);
  EXPECT_THROW(index_->search(1, {1, 0, 0, 0}, 3, SearchFilters{}),
               docqa_core::InvalidParametersError);
  // Still rejected when nothing is asked for
  EXPECT_THROW(index_->search(1, {1, 0}, 0, SearchFilters{}), docqa_core::InvalidParametersError);
}

TEST_F(LocalVectorIndexTest, ScoresAreCosineSimilarities) {
  // Unnormalized input; stored vectors are normalized
  index_->add(1, 1, {3, 0, 0}, {1, 0, ""});
  index_->add(1, 2, {1, 1, 0}, {1, 1, ""});

  auto hits = index_->search(1, {10, 0, 0}, 5, SearchFilters{});

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, 1);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_EQ(hits[1].chunk_id, 2);
  EXPECT_NEAR(hits[1].score, 0.70710678f, 1e-5);
}

TEST_F(LocalVectorIndexTest, KLargerThanIndexReturnsEverything) {
  index_->add_batch(1, {{1, {1, 0, 0}, {1, 0, ""}}, {2, {0, 1, 0}, {1, 1, ""}}});

  EXPECT_EQ(index_->search(1, {1, 0, 0}, 50, SearchFilters{}).size(), 2u);
  EXPECT_TRUE(index_->search(1, {1, 0, 0}, 0, SearchFilters{}).empty());
}

TEST_F(LocalVectorIndexTest, FilterOnUnknownDocumentReturnsNothing) {
  index_->add(1, 1, {1, 0, 0}, {1, 0, ""});

  SearchFilters filters;
  filters.document_ids = {42};
  EXPECT_TRUE(index_->search(1, {1, 0, 0}, 5, filters).empty());
}

TEST_F(LocalVectorIndexTest, ShardIsRebuiltFromDatabase) {
  index_->add_batch(7, {{1, {1, 0, 0}, {3, 0, ""}}, {2, {0, 1, 0}, {3, 1, ""}},
                        {3, {0, 0, 1}, {4, 0, ""}}});
  index_->delete_chunk(7, 3);

  LocalVectorIndex reopened(*db_manager_, 3);

  EXPECT_EQ(reopened.size(7), 2u);
  auto hits = reopened.search(7, {0, 1, 0}, 1, SearchFilters{});
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, 2);

  // Document membership survives the rebuild
  reopened.delete_document(7, 3);
  EXPECT_EQ(reopened.size(7), 0u);
}

TEST_F(LocalVectorIndexTest, ForeignChunkIdIsNotTakenOver) {
  index_->add(1, 5, {1, 0, 0}, {1, 0, ""});
  EXPECT_THROW(index_->add(2, 5, {0, 1, 0}, {9, 0, ""}), docqa_core::InvalidParametersError);
  EXPECT_THROW(index_->add_batch(2, {VectorEntry{6, {0, 1, 0}, {9, 0, ""}},
                                     VectorEntry{5, {0, 1, 0}, {9, 1, ""}}}),
               docqa_core::InvalidParametersError);

  EXPECT_EQ(index_->size(2), 0u);
  EXPECT_TRUE(index_->search(2, {0, 1, 0}, 5, SearchFilters{}).empty());
  auto live = index_->search(1, {1, 0, 0}, 5, SearchFilters{});
  ASSERT_EQ(live.size(), 1u);
  EXPECT_EQ(live[0].chunk_id, 5);
  EXPECT_NEAR(live[0].score, 1.0f, 1e-5);

  LocalVectorIndex reopened(*db_manager_, 3);
  auto hits = reopened.search(1, {1, 0, 0}, 5, SearchFilters{});
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  EXPECT_EQ(reopened.size(2), 0u);
}

TEST_F(LocalVectorIndexTest, ConcurrentWritersAndReaders) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < 25; ++i) {
        const docqa_core::ChunkId id = t * 100 + i + 1;
        index_->add(1, id, {1.0f, static_cast<float>(i), static_cast<float>(t)}, {t + 1, i, ""});
        index_->search(1, {1, 0, 0}, 5, SearchFilters{});
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(index_->size(1), 100u);
}

}  // namespace docqa_tests
