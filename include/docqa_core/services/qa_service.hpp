#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/db/document_store.hpp"
#include "docqa_core/generation/fallback_chain.hpp"
#include "docqa_core/retrieval/retrieval_engine.hpp"
#include "docqa_core/session/streaming_session.hpp"

namespace docqa_core {

struct QuestionRequest {
  OwnerId owner_id = 0;
  std::string question;
  std::optional<size_t> top_k;
  std::optional<size_t> max_context_length;
  // Restrict retrieval to these documents; empty means all
  std::vector<DocumentId> document_ids;
};

struct AnswerResult {
  std::string answer;
  long long elapsed_ms = 0;
  std::vector<ChunkId> chunk_ids;
  std::string backend;
  std::vector<FallbackNotice> fallbacks;
};

struct QaSettings {
  size_t top_k = 5;
  size_t max_context_length = 4000;
  size_t stream_buffer_capacity = 16;
  // Recorded questions allowed per owner in any trailing hour
  int max_queries_per_hour = 100;
};

class QaService {
 public:
  QaService(std::shared_ptr<RetrievalEngine> retrieval,
            std::shared_ptr<FallbackChain> chain,
            std::shared_ptr<DocumentStore> store,
            QaSettings settings = {});

  // Whole answer; errors propagate as DocqaError subclasses. An owner over the
  // hourly query limit gets LimitExceededError before any retrieval.
  AnswerResult answer(const QuestionRequest &request);

  // A session ready to run; the caller owns it and may cancel it from another thread
  std::unique_ptr<StreamingSession> open_session(const QuestionRequest &request);

  // open_session + run on the calling thread
  SessionState stream(const QuestionRequest &request, const EventSink &sink);

  std::vector<QueryRecord> history(OwnerId owner_id, int limit);

  // Count and mean response time of the owner's questions over the trailing window
  QueryUsage usage(OwnerId owner_id, std::chrono::hours window);

  std::string describe_chain() const {
    return chain_->describe();
  }

 private:
  SessionRequest to_session_request(const QuestionRequest &request) const;
  void check_query_quota(OwnerId owner_id) const;

  std::shared_ptr<RetrievalEngine> retrieval_;
  std::shared_ptr<FallbackChain> chain_;
  std::shared_ptr<DocumentStore> store_;
  QaSettings settings_;
};

}  // namespace docqa_core
