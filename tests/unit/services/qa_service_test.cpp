#include "docqa_core/services/qa_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docqa_core/embedding/hashing_embedding_provider.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/generation/extractive_backend.hpp"
#include "docqa_core/index/local_vector_index.hpp"
#include "docqa_core/services/ingestion_service.hpp"

namespace docqa_tests {

using docqa_core::QaService;
using docqa_core::QuestionRequest;
using docqa_core::StreamEvent;
using docqa_core::StreamEventType;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

constexpr size_t kDim = 64;

QuestionRequest question_for(docqa_core::OwnerId owner, const std::string &question) {
  QuestionRequest request;
  request.owner_id = owner;
  request.question = question;
  return request;
}

}  // namespace

class QaServiceTest : public DocumentStoreTestBase {
 protected:
  void SetUp() override {
    DocumentStoreTestBase::SetUp();
    embedder_ = std::make_shared<docqa_core::HashingEmbeddingProvider>(kDim);
    index_ = std::make_shared<docqa_core::LocalVectorIndex>(*db_manager_, kDim);
    ingestion_ = std::make_unique<docqa_core::IngestionService>(document_store_, embedder_, index_);
    retrieval_ = std::make_shared<docqa_core::RetrievalEngine>(embedder_, index_, document_store_);
    primary_ = std::make_shared<MockGenerationBackend>("primary");
    chain_ = std::make_shared<docqa_core::FallbackChain>(
        std::vector<std::shared_ptr<docqa_core::GenerationBackend>>{
            primary_, std::make_shared<docqa_core::ExtractiveBackend>()});
    service_ = std::make_unique<QaService>(retrieval_, chain_, document_store_);

    docqa_core::IngestRequest request;
    request.owner_id = 1;
    request.filename = "bees.txt";
    request.text = "Honey bees live in colonies. A colony has one queen bee.";
    bees_ = ingestion_->ingest(request).document_id;
  }

  void TearDown() override {
    service_.reset();
    ingestion_.reset();
    retrieval_.reset();
    index_.reset();
    DocumentStoreTestBase::TearDown();
  }

  std::shared_ptr<docqa_core::HashingEmbeddingProvider> embedder_;
  std::shared_ptr<docqa_core::LocalVectorIndex> index_;
  std::unique_ptr<docqa_core::IngestionService> ingestion_;
  std::shared_ptr<docqa_core::RetrievalEngine> retrieval_;
  std::shared_ptr<MockGenerationBackend> primary_;
  std::shared_ptr<docqa_core::FallbackChain> chain_;
  std::unique_ptr<QaService> service_;
  docqa_core::DocumentId bees_ = 0;
};

TEST_F(QaServiceTest, AnswerUsesContextAndRecordsHistory) {
  docqa_core::ContextBundle seen;
  EXPECT_CALL(*primary_, generate(_, _))
      .WillOnce(testing::DoAll(testing::SaveArg<0>(&seen), Return("One queen.")));

  auto result = service_->answer(question_for(1, "  How many queens does a colony have?  "));

  EXPECT_EQ(result.answer, "One queen.");
  EXPECT_EQ(result.backend, "primary");
  EXPECT_TRUE(result.fallbacks.empty());
  ASSERT_EQ(result.chunk_ids.size(), 1u);
  EXPECT_EQ(seen.question, "How many queens does a colony have?");
  ASSERT_EQ(seen.entries.size(), 1u);
  EXPECT_EQ(seen.entries[0].document_id, bees_);

  auto history = service_->history(1, 10);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].question, "How many queens does a colony have?");
  EXPECT_EQ(history[0].answer, "One queen.");
  EXPECT_EQ(history[0].chunks_used, 1);
  EXPECT_EQ(history[0].backend, "primary");
}

TEST_F(QaServiceTest, FallbackIsReportedInResult) {
  EXPECT_CALL(*primary_, generate(_, _))
      .WillOnce(Throw(docqa_core::GenerationBackendError("primary", "timeout")));

  auto result = service_->answer(question_for(1, "What is a colony?"));

  EXPECT_EQ(result.backend, "extractive");
  ASSERT_EQ(result.fallbacks.size(), 1u);
  EXPECT_EQ(result.fallbacks[0].message(), "fallback: primary unavailable, using extractive");
  EXPECT_EQ(result.answer.rfind("Based on the provided context:", 0), 0u);
  EXPECT_EQ(service_->history(1, 5)[0].backend, "extractive");
}

TEST_F(QaServiceTest, OwnerWithoutDocumentsGetsRefusal) {
  EXPECT_CALL(*primary_, generate(_, _)).WillOnce(Return(docqa_core::kNoContextAnswer));

  auto result = service_->answer(question_for(2, "How many queens?"));

  EXPECT_TRUE(result.chunk_ids.empty());
  EXPECT_EQ(result.answer, docqa_core::kNoContextAnswer);
  EXPECT_TRUE(service_->history(1, 5).empty());
  EXPECT_EQ(service_->history(2, 5).size(), 1u);
}

TEST_F(QaServiceTest, DocumentFilterNarrowsRetrieval) {
  docqa_core::ContextBundle seen;
  EXPECT_CALL(*primary_, generate(_, _))
      .WillOnce(testing::DoAll(testing::SaveArg<0>(&seen), Return("none")));

  auto request = question_for(1, "How many queens?");
  request.document_ids = {bees_ + 1000};
  service_->answer(request);

  EXPECT_TRUE(seen.empty());
}

TEST_F(QaServiceTest, BadRequestsAreRejected) {
  EXPECT_THROW(service_->answer(question_for(1, "   ")), docqa_core::InvalidParametersError);

  auto zero_k = question_for(1, "q");
  zero_k.top_k = 0;
  EXPECT_THROW(service_->answer(zero_k), docqa_core::InvalidParametersError);
  EXPECT_TRUE(service_->history(1, 5).empty());
}

TEST_F(QaServiceTest, StreamRunsSessionAndRecords) {
  EXPECT_CALL(*primary_, generate_stream(_, _, _))
      .WillOnce(testing::Invoke([](const docqa_core::ContextBundle &,
                                   const docqa_core::GenerationOptions &,
                                   const docqa_core::FragmentCallback &on_fragment) {
        on_fragment("One ");
        on_fragment("queen.");
      }));

  std::vector<StreamEvent> events;
  auto state = service_->stream(question_for(1, "How many queens?"), [&](const StreamEvent &e) {
    events.push_back(e);
    return true;
  });

  EXPECT_EQ(state, docqa_core::SessionState::Completed);
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, StreamEventType::Complete);
  EXPECT_EQ(events.back().chunks_used, 1);
  auto history = service_->history(1, 5);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].answer, "One queen.");
}

TEST_F(QaServiceTest, StreamWithBlankQuestionEmitsSingleError) {
  std::vector<StreamEvent> events;
  auto state = service_->stream(question_for(1, ""), [&](const StreamEvent &e) {
    events.push_back(e);
    return true;
  });

  EXPECT_EQ(state, docqa_core::SessionState::Errored);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, StreamEventType::Error);
  EXPECT_EQ(events[0].error_kind, "invalid_parameters");
}

TEST_F(QaServiceTest, HourlyQueryLimitIsPerOwner) {
  docqa_core::QaSettings settings;
  settings.max_queries_per_hour = 2;
  service_ = std::make_unique<QaService>(retrieval_, chain_, document_store_, settings);
  EXPECT_CALL(*primary_, generate(_, _)).Times(3).WillRepeatedly(Return("One queen."));

  service_->answer(question_for(1, "How many queens?"));
  service_->answer(question_for(1, "How many queens again?"));

  EXPECT_THROW(service_->answer(question_for(1, "And once more?")),
               docqa_core::LimitExceededError);
  EXPECT_EQ(service_->history(1, 10).size(), 2u);

  std::vector<StreamEvent> events;
  auto state = service_->stream(question_for(1, "Streaming now?"), [&](const StreamEvent &e) {
    events.push_back(e);
    return true;
  });
  EXPECT_EQ(state, docqa_core::SessionState::Errored);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].error_kind, "limit_exceeded");

  EXPECT_NO_THROW(service_->answer(question_for(2, "How many queens?")));
}

TEST_F(QaServiceTest, QueriesOlderThanAnHourDoNotCount) {
  docqa_core::QaSettings settings;
  settings.max_queries_per_hour = 2;
  service_ = std::make_unique<QaService>(retrieval_, chain_, document_store_, settings);
  for (int i = 0; i < 2; ++i) {
    docqa_core::QueryRecord old;
    old.owner_id = 1;
    old.question = "yesterday";
    old.created_at = std::chrono::system_clock::now() - std::chrono::hours(2);
    document_store_->record_query(old);
  }
  EXPECT_CALL(*primary_, generate(_, _)).WillOnce(Return("One queen."));

  EXPECT_EQ(service_->answer(question_for(1, "How many queens?")).answer, "One queen.");
}

TEST_F(QaServiceTest, UsageSummarizesTrailingWindow) {
  const auto now = std::chrono::system_clock::now();
  for (long long ms : {100LL, 300LL}) {
    docqa_core::QueryRecord record;
    record.owner_id = 1;
    record.question = "q";
    record.response_time_ms = ms;
    record.created_at = now - std::chrono::minutes(30);
    document_store_->record_query(record);
  }
  docqa_core::QueryRecord old;
  old.owner_id = 1;
  old.question = "old";
  old.response_time_ms = 5000;
  old.created_at = now - std::chrono::hours(30);
  document_store_->record_query(old);

  auto recent = service_->usage(1, std::chrono::hours(1));
  EXPECT_EQ(recent.total_queries, 2);
  EXPECT_EQ(recent.avg_response_time_ms, 200);
  EXPECT_EQ(service_->usage(1, std::chrono::hours(48)).total_queries, 3);
  EXPECT_EQ(service_->usage(2, std::chrono::hours(1)).total_queries, 0);
  EXPECT_THROW(service_->usage(1, std::chrono::hours(0)), docqa_core::InvalidParametersError);
}

TEST_F(QaServiceTest, DescribesChain) {
  EXPECT_EQ(service_->describe_chain(), "primary > extractive");
}

}  // namespace docqa_tests
