#include "docqa_core/services/ingestion_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docqa_core/embedding/hashing_embedding_provider.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/index/local_vector_index.hpp"
#include "docqa_core/util/hashing.hpp"

namespace docqa_tests {

using docqa_core::IngestionService;
using docqa_core::IngestRequest;
using docqa_core::SearchFilters;
using ::testing::_;
using ::testing::Throw;

namespace {

constexpr size_t kDim = 32;

IngestRequest request_for(docqa_core::OwnerId owner, const std::string &text,
                          const std::string &filename = "notes.txt") {
  IngestRequest request;
  request.owner_id = owner;
  request.filename = filename;
  request.text = text;
  return request;
}

}  // namespace

class IngestionServiceTest : public DocumentStoreTestBase {
 protected:
  void SetUp() override {
    DocumentStoreTestBase::SetUp();
    embedder_ = std::make_shared<docqa_core::HashingEmbeddingProvider>(kDim);
    index_ = std::make_shared<docqa_core::LocalVectorIndex>(*db_manager_, kDim);
    service_ = std::make_unique<IngestionService>(document_store_, embedder_, index_);
  }

  void TearDown() override {
    service_.reset();
    index_.reset();
    DocumentStoreTestBase::TearDown();
  }

  std::shared_ptr<docqa_core::HashingEmbeddingProvider> embedder_;
  std::shared_ptr<docqa_core::LocalVectorIndex> index_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, IngestStoresChunksAndVectors) {
  const std::string text = TestUtilities::create_sentences(2500);

  auto result = service_->ingest(request_for(1, text, "guide.txt"));

  EXPECT_FALSE(result.duplicate);
  EXPECT_GT(result.document_id, 0);
  EXPECT_EQ(result.chunk_count, 3);
  EXPECT_EQ(result.content_hash, docqa_core::sha256_hex(text));
  EXPECT_EQ(index_->size(1), 3u);

  auto chunks = document_store_->get_document_chunks(1, result.document_id);
  ASSERT_EQ(chunks.size(), 3u);
  auto docs = service_->list_documents(1);
  ASSERT_EQ(docs.size(), 1u);
  EXPECT_EQ(docs[0].filename, "guide.txt");
  EXPECT_EQ(docs[0].file_size, text.size());
}

TEST_F(IngestionServiceTest, SameContentTwiceIsADuplicate) {
  auto first = service_->ingest(request_for(1, "Short document about owls."));
  auto second = service_->ingest(request_for(1, "Short document about owls.", "renamed.txt"));

  EXPECT_TRUE(second.duplicate);
  EXPECT_EQ(second.document_id, first.document_id);
  EXPECT_EQ(document_store_->count_documents(1), 1);
  EXPECT_EQ(index_->size(1), 1u);
}

TEST_F(IngestionServiceTest, FingerprintUsesRawBytesWhenGiven) {
  auto request = request_for(1, "Same decoded text.");
  request.raw_bytes = std::string("%PDF-1.4 original bytes A");
  auto first = service_->ingest(request);
  request.raw_bytes = std::string("%PDF-1.4 original bytes B");
  auto second = service_->ingest(request);

  EXPECT_FALSE(second.duplicate);
  EXPECT_NE(first.content_hash, second.content_hash);
  EXPECT_EQ(first.content_hash, docqa_core::sha256_hex("%PDF-1.4 original bytes A"));
}

TEST_F(IngestionServiceTest, OwnersDoNotShareDeduplication) {
  auto mine = service_->ingest(request_for(1, "Shared text."));
  auto theirs = service_->ingest(request_for(2, "Shared text."));

  EXPECT_FALSE(theirs.duplicate);
  EXPECT_NE(mine.document_id, theirs.document_id);
  EXPECT_EQ(service_->list_documents(1).size(), 1u);
  EXPECT_EQ(service_->list_documents(2).size(), 1u);
}

TEST_F(IngestionServiceTest, ConcurrentDuplicateUploadsProduceOneDocument) {
  const std::string text = TestUtilities::create_sentences(1500);
  std::atomic<int> fresh{0};
  std::atomic<int> duplicates{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&] {
      auto result = service_->ingest(request_for(1, text));
      (result.duplicate ? duplicates : fresh)++;
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(fresh.load(), 1);
  EXPECT_EQ(duplicates.load(), 5);
  EXPECT_EQ(document_store_->count_documents(1), 1);
}

TEST_F(IngestionServiceTest, RejectsBlankTextAndBadChunking) {
  EXPECT_THROW(service_->ingest(request_for(1, "  \n\t ")), docqa_core::InvalidParametersError);

  auto request = request_for(1, "Some text.");
  request.chunking.target_size = 100;
  request.chunking.overlap = 100;
  EXPECT_THROW(service_->ingest(request), docqa_core::InvalidParametersError);
  EXPECT_EQ(document_store_->count_documents(1), 0);
}

TEST_F(IngestionServiceTest, DocumentLimitIsEnforced) {
  service_ = std::make_unique<IngestionService>(document_store_, embedder_, index_,
                                                docqa_core::IngestionLimits{2, 1000});
  service_->ingest(request_for(1, "one"));
  service_->ingest(request_for(1, "two"));

  EXPECT_THROW(service_->ingest(request_for(1, "three")), docqa_core::LimitExceededError);
  // A duplicate of stored content is still answered
  EXPECT_TRUE(service_->ingest(request_for(1, "two")).duplicate);
  EXPECT_NO_THROW(service_->ingest(request_for(2, "three")));
}

TEST_F(IngestionServiceTest, ConcurrentDistinctUploadsStayWithinDocumentLimit) {
  service_ = std::make_unique<IngestionService>(document_store_, embedder_, index_,
                                                docqa_core::IngestionLimits{3, 1000});
  std::atomic<int> stored{0};
  std::atomic<int> limited{0};
  std::atomic<int> stored_chunks{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        auto result = service_->ingest(
            request_for(1, "Document number " + std::to_string(i) + " about rivers.",
                        "doc" + std::to_string(i) + ".txt"));
        stored++;
        stored_chunks += result.chunk_count;
      } catch (const docqa_core::LimitExceededError &) {
        limited++;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(stored.load(), 3);
  EXPECT_EQ(limited.load(), 5);
  EXPECT_EQ(document_store_->count_documents(1), 3);
  EXPECT_EQ(index_->size(1), static_cast<size_t>(stored_chunks.load()));
}

TEST_F(IngestionServiceTest, ChunkLimitIsEnforcedBeforeWriting) {
  service_ = std::make_unique<IngestionService>(document_store_, embedder_, index_,
                                                docqa_core::IngestionLimits{100, 2});

  EXPECT_THROW(service_->ingest(request_for(1, TestUtilities::create_sentences(2500))),
               docqa_core::LimitExceededError);
  EXPECT_EQ(document_store_->count_documents(1), 0);
  EXPECT_EQ(index_->size(1), 0u);
}

TEST_F(IngestionServiceTest, DimensionMismatchIsRejected) {
  auto other = std::make_shared<docqa_core::HashingEmbeddingProvider>(kDim + 1);
  EXPECT_THROW(IngestionService(document_store_, other, index_),
               docqa_core::InvalidParametersError);
}

TEST_F(IngestionServiceTest, IndexFailureRollsBackTheDocument) {
  auto failing_index = std::make_shared<MockVectorIndex>(kDim);
  EXPECT_CALL(*failing_index, add_batch(1, _))
      .WillOnce(Throw(docqa_core::IndexUnavailableError("index down")));
  EXPECT_CALL(*failing_index, delete_document(1, _));
  IngestionService service(document_store_, embedder_, failing_index);

  EXPECT_THROW(service.ingest(request_for(1, "Doomed document.")),
               docqa_core::IndexUnavailableError);
  EXPECT_EQ(document_store_->count_documents(1), 0);
  EXPECT_FALSE(
      document_store_->find_by_hash(1, docqa_core::sha256_hex("Doomed document.")).has_value());
}

TEST_F(IngestionServiceTest, EmbeddingFailureWritesNothing) {
  auto failing_embedder = std::make_shared<MockEmbeddingProvider>(kDim);
  EXPECT_CALL(*failing_embedder, embed(_))
      .WillOnce(Throw(docqa_core::EmbeddingUnavailableError("model missing")));
  IngestionService service(document_store_, failing_embedder, index_);

  EXPECT_THROW(service.ingest(request_for(1, "Never stored.")),
               docqa_core::EmbeddingUnavailableError);
  EXPECT_EQ(document_store_->count_documents(1), 0);
}

TEST_F(IngestionServiceTest, DeleteRemovesTextAndVectors) {
  auto kept = service_->ingest(request_for(1, "Keep this one."));
  auto gone = service_->ingest(request_for(1, "Remove this one."));

  EXPECT_TRUE(service_->delete_document(1, gone.document_id));
  EXPECT_FALSE(service_->delete_document(1, gone.document_id));
  // Another owner cannot delete it
  EXPECT_FALSE(service_->delete_document(2, kept.document_id));

  EXPECT_EQ(index_->size(1), 1u);
  auto hits = index_->search(1, embedder_->embed("Remove this one."), 5, SearchFilters{});
  ASSERT_EQ(hits.size(), 1u);
  auto resolved = document_store_->resolve_chunks(1, {hits[0].chunk_id});
  ASSERT_EQ(resolved.size(), 1u);
  EXPECT_EQ(resolved[0].document_id, kept.document_id);
}

TEST_F(IngestionServiceTest, DeleteAllWipesOnlyThatOwner) {
  service_->ingest(request_for(1, "a"));
  service_->ingest(request_for(1, "b"));
  service_->ingest(request_for(2, "c"));

  EXPECT_EQ(service_->delete_all(1), 2);

  EXPECT_TRUE(service_->list_documents(1).empty());
  EXPECT_EQ(index_->size(1), 0u);
  EXPECT_EQ(index_->size(2), 1u);
  EXPECT_EQ(service_->delete_all(1), 0);
}

}  // namespace docqa_tests
