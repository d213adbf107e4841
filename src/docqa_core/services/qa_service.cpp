#include "docqa_core/services/qa_service.hpp"

#include <chrono>
#include <iostream>

#include "docqa_core/errors.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

QaService::QaService(std::shared_ptr<RetrievalEngine> retrieval,
                     std::shared_ptr<FallbackChain> chain,
                     std::shared_ptr<DocumentStore> store,
                     QaSettings settings)
    : retrieval_(std::move(retrieval)),
      chain_(std::move(chain)),
      store_(std::move(store)),
      settings_(settings) {
  if (!retrieval_ || !chain_ || !store_) {
    throw InvalidParametersError("QaService requires retrieval, a generation chain and a store");
  }
}

SessionRequest QaService::to_session_request(const QuestionRequest &request) const {
  if (text::is_blank(request.question)) {
    throw InvalidParametersError("question must not be empty");
  }
  check_query_quota(request.owner_id);
  SessionRequest session;
  session.owner_id = request.owner_id;
  session.question = text::trim(request.question);
  session.retrieval.top_k = request.top_k.value_or(settings_.top_k);
  session.retrieval.max_context_length =
      request.max_context_length.value_or(settings_.max_context_length);
  session.retrieval.filters.document_ids = request.document_ids;
  session.retrieval.filters.text_hint = session.question;
  return session;
}

void QaService::check_query_quota(OwnerId owner_id) const {
  const auto hour_ago = std::chrono::system_clock::now() - std::chrono::hours(1);
  if (store_->count_queries_since(owner_id, hour_ago) >= settings_.max_queries_per_hour) {
    throw LimitExceededError("query limit of " + std::to_string(settings_.max_queries_per_hour) +
                             " per hour reached");
  }
}

AnswerResult QaService::answer(const QuestionRequest &request) {
  const SessionRequest session = to_session_request(request);
  const auto start = std::chrono::steady_clock::now();

  ContextBundle bundle = retrieval_->retrieve(session.owner_id, session.question, session.retrieval);
  GenerationResult generated = chain_->generate(bundle, session.generation);

  AnswerResult result;
  result.answer = std::move(generated.text);
  result.backend = std::move(generated.backend);
  result.fallbacks = std::move(generated.fallbacks);
  result.chunk_ids = bundle.chunk_ids();
  result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count();

  QueryRecord record;
  record.owner_id = session.owner_id;
  record.question = session.question;
  record.answer = result.answer;
  record.response_time_ms = result.elapsed_ms;
  record.chunks_used = static_cast<int>(bundle.entries.size());
  record.backend = result.backend;
  record.created_at = std::chrono::system_clock::now();
  try {
    store_->record_query(record);
  } catch (const DocqaError &e) {
    std::cerr << "[QaService] failed to record query: " << e.what() << std::endl;
  }
  return result;
}

std::unique_ptr<StreamingSession> QaService::open_session(const QuestionRequest &request) {
  return std::make_unique<StreamingSession>(to_session_request(request), retrieval_, chain_,
                                            store_, settings_.stream_buffer_capacity);
}

SessionState QaService::stream(const QuestionRequest &request, const EventSink &sink) {
  std::unique_ptr<StreamingSession> session;
  try {
    session = open_session(request);
  } catch (const DocqaError &e) {
    sink(StreamEvent::error(to_string(e.kind()), e.what()));
    return SessionState::Errored;
  }
  return session->run(sink);
}

std::vector<QueryRecord> QaService::history(OwnerId owner_id, int limit) {
  return store_->list_queries(owner_id, limit);
}

QueryUsage QaService::usage(OwnerId owner_id, std::chrono::hours window) {
  if (window.count() <= 0) {
    throw InvalidParametersError("usage window must be positive");
  }
  return store_->query_usage_since(owner_id, std::chrono::system_clock::now() - window);
}

}  // namespace docqa_core
