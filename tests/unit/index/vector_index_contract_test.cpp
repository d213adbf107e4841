#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>

#include "common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/index/elasticsearch_vector_index.hpp"
#include "docqa_core/index/local_vector_index.hpp"
#include "docqa_core/index/qdrant_vector_index.hpp"

namespace docqa_tests {

using docqa_core::SearchFilters;
using docqa_core::VectorEntry;
using docqa_core::VectorHit;

namespace {

constexpr size_t kDim = 4;

std::string unique_name(const std::string &prefix) {
  static std::atomic<int> counter{0};
  return prefix + std::to_string(getpid()) + "-" + std::to_string(counter++);
}

VectorEntry entry(docqa_core::ChunkId chunk_id,
                  std::vector<float> vector,
                  docqa_core::DocumentId document_id,
                  int chunk_index = 0) {
  return VectorEntry{chunk_id, std::move(vector), {document_id, chunk_index, "chunk text"}};
}

std::vector<docqa_core::ChunkId> ids_of(const std::vector<VectorHit> &hits) {
  std::vector<docqa_core::ChunkId> ids;
  for (const auto &hit : hits) {
    ids.push_back(hit.chunk_id);
  }
  return ids;
}

}  // namespace

/**
 * One suite, run against every index variant. Remote variants need a server
 * named by DOCQA_TEST_QDRANT_URL / DOCQA_TEST_ELASTICSEARCH_URL.
 */
class VectorIndexContractTest : public ::testing::TestWithParam<std::string> {
 protected:
  void SetUp() override {
    const std::string backend = GetParam();
    if (backend == "local") {
      temp_db_path_ = TestUtilities::create_temp_test_db();
      db_manager_ =
          std::make_unique<docqa_core::DatabaseManager>(temp_db_path_, "docqa_test_key", 2);
      index_ = std::make_unique<docqa_core::LocalVectorIndex>(*db_manager_, kDim);
    } else if (backend == "qdrant") {
      const char *url = std::getenv("DOCQA_TEST_QDRANT_URL");
      if (!url) {
        GTEST_SKIP() << "DOCQA_TEST_QDRANT_URL not set";
      }
      docqa_core::QdrantConfig config;
      config.url = url;
      config.collection = unique_name("docqa_test_");
      index_ = std::make_unique<docqa_core::QdrantVectorIndex>(config, kDim);
    } else {
      const char *url = std::getenv("DOCQA_TEST_ELASTICSEARCH_URL");
      if (!url) {
        GTEST_SKIP() << "DOCQA_TEST_ELASTICSEARCH_URL not set";
      }
      docqa_core::ElasticsearchConfig config;
      config.url = url;
      config.index = unique_name("docqa-test-");
      index_ = std::make_unique<docqa_core::ElasticsearchVectorIndex>(config, kDim);
    }
  }

  void TearDown() override {
    if (index_) {
      for (docqa_core::OwnerId owner : {kOwnerA, kOwnerB}) {
        index_->delete_all(owner);
      }
      index_.reset();
    }
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
      TestUtilities::cleanup_temp_db(temp_db_path_);
    }
  }

  static constexpr docqa_core::OwnerId kOwnerA = 101;
  static constexpr docqa_core::OwnerId kOwnerB = 202;

  std::filesystem::path temp_db_path_;
  std::unique_ptr<docqa_core::DatabaseManager> db_manager_;
  std::unique_ptr<docqa_core::VectorIndex> index_;
};

TEST_P(VectorIndexContractTest, EmptyIndexReturnsNoHits) {
  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 5, SearchFilters{});
  EXPECT_TRUE(hits.empty());
}

TEST_P(VectorIndexContractTest, ReturnsMostSimilarFirstAndAtMostK) {
  index_->add_batch(kOwnerA, {entry(1, {1, 0, 0, 0}, 10, 0), entry(2, {0, 1, 0, 0}, 10, 1),
                              entry(3, {0.6f, 0.8f, 0, 0}, 10, 2)});

  auto hits = index_->search(kOwnerA, {0, 1, 0, 0}, 2, SearchFilters{});

  ASSERT_EQ(hits.size(), 2u);
  EXPECT_EQ(hits[0].chunk_id, 2);
  EXPECT_EQ(hits[1].chunk_id, 3);
  EXPECT_GT(hits[0].score, hits[1].score);
}

TEST_P(VectorIndexContractTest, NeverReturnsAnotherOwnersChunks) {
  index_->add_batch(kOwnerA, {entry(1, {1, 0, 0, 0}, 10), entry(2, {0, 1, 0, 0}, 10)});
  // Owner B ingests vectors identical to the query
  index_->add_batch(kOwnerB, {entry(11, {0, 0, 1, 0}, 20), entry(12, {0, 0, 1, 0.01f}, 20)});

  auto hits = index_->search(kOwnerA, {0, 0, 1, 0}, 10, SearchFilters{});

  for (auto id : ids_of(hits)) {
    EXPECT_TRUE(id == 1 || id == 2) << "owner A saw chunk " << id;
  }
  auto b_hits = index_->search(kOwnerB, {1, 0, 0, 0}, 10, SearchFilters{});
  for (auto id : ids_of(b_hits)) {
    EXPECT_TRUE(id == 11 || id == 12) << "owner B saw chunk " << id;
  }
}

TEST_P(VectorIndexContractTest, ReAddingAChunkOverwritesIt) {
  index_->add(kOwnerA, 1, {1, 0, 0, 0}, {10, 0, "old"});
  index_->add(kOwnerA, 1, {0, 1, 0, 0}, {10, 0, "new"});

  auto hits = index_->search(kOwnerA, {0, 1, 0, 0}, 10, SearchFilters{});

  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, 1);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-3);
}

TEST_P(VectorIndexContractTest, SameChunkIdUnderTwoOwnersIsRejected) {
  index_->add(kOwnerA, 5, {1, 0, 0, 0}, {10, 0, "a"});

  EXPECT_THROW(index_->add(kOwnerB, 5, {0, 1, 0, 0}, {20, 0, "b"}),
               docqa_core::InvalidParametersError);
  EXPECT_THROW(index_->add_batch(kOwnerB, {entry(6, {0, 1, 0, 0}, 20), entry(5, {0, 1, 0, 0}, 20)}),
               docqa_core::InvalidParametersError);

  EXPECT_TRUE(index_->search(kOwnerB, {0, 1, 0, 0}, 10, SearchFilters{}).empty());
  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 10, SearchFilters{});
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].chunk_id, 5);
  EXPECT_NEAR(hits[0].score, 1.0f, 1e-3);
}

TEST_P(VectorIndexContractTest, DeletedDocumentNeverComesBack) {
  index_->add_batch(kOwnerA, {entry(1, {1, 0, 0, 0}, 10), entry(2, {0.9f, 0.1f, 0, 0}, 10),
                              entry(3, {0, 1, 0, 0}, 11)});

  index_->delete_document(kOwnerA, 10);

  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 10, SearchFilters{});
  EXPECT_EQ(ids_of(hits), std::vector<docqa_core::ChunkId>{3});
}

TEST_P(VectorIndexContractTest, DeleteChunkRemovesOnlyThatChunk) {
  index_->add_batch(kOwnerA, {entry(1, {1, 0, 0, 0}, 10), entry(2, {0, 1, 0, 0}, 10)});

  index_->delete_chunk(kOwnerA, 1);

  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 10, SearchFilters{});
  EXPECT_EQ(ids_of(hits), std::vector<docqa_core::ChunkId>{2});
}

TEST_P(VectorIndexContractTest, DeletesAreIdempotent) {
  EXPECT_NO_THROW(index_->delete_chunk(kOwnerA, 999));
  EXPECT_NO_THROW(index_->delete_document(kOwnerA, 999));
  EXPECT_NO_THROW(index_->delete_all(kOwnerA));
  EXPECT_NO_THROW(index_->delete_all(kOwnerA));
}

TEST_P(VectorIndexContractTest, DeleteOfAnotherOwnersChunkHasNoEffect) {
  index_->add(kOwnerA, 1, {1, 0, 0, 0}, {10, 0, "a"});

  index_->delete_chunk(kOwnerB, 1);
  index_->delete_document(kOwnerB, 10);

  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 10, SearchFilters{});
  EXPECT_EQ(ids_of(hits), std::vector<docqa_core::ChunkId>{1});
}

TEST_P(VectorIndexContractTest, DeleteAllWipesOnlyThatOwner) {
  index_->add(kOwnerA, 1, {1, 0, 0, 0}, {10, 0, "a"});
  index_->add(kOwnerB, 2, {1, 0, 0, 0}, {20, 0, "b"});

  index_->delete_all(kOwnerA);

  EXPECT_TRUE(index_->search(kOwnerA, {1, 0, 0, 0}, 10, SearchFilters{}).empty());
  EXPECT_EQ(ids_of(index_->search(kOwnerB, {1, 0, 0, 0}, 10, SearchFilters{})),
            std::vector<docqa_core::ChunkId>{2});
}

TEST_P(VectorIndexContractTest, DocumentFilterRestrictsHits) {
  index_->add_batch(kOwnerA, {entry(1, {1, 0, 0, 0}, 10), entry(2, {0.8f, 0.2f, 0, 0}, 11),
                              entry(3, {0, 1, 0, 0}, 12)});

  SearchFilters filters;
  filters.document_ids = {11, 12};
  auto hits = index_->search(kOwnerA, {1, 0, 0, 0}, 10, filters);

  auto ids = ids_of(hits);
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<docqa_core::ChunkId>{2, 3}));
}

INSTANTIATE_TEST_SUITE_P(AllBackends,
                         VectorIndexContractTest,
                         ::testing::Values("local", "qdrant", "elasticsearch"),
                         [](const ::testing::TestParamInfo<std::string> &info) {
                           return info.param;
                         });

}  // namespace docqa_tests
