#include "docqa_core/session/streaming_session.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::Init:
      return "init";
    case SessionState::Searching:
      return "searching";
    case SessionState::Generating:
      return "generating";
    case SessionState::Completed:
      return "completed";
    case SessionState::Errored:
      return "errored";
    case SessionState::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

StreamingSession::StreamingSession(SessionRequest request,
                                   std::shared_ptr<RetrievalEngine> retrieval,
                                   std::shared_ptr<FallbackChain> chain,
                                   std::shared_ptr<QueryRecorder> recorder,
                                   size_t buffer_capacity)
    : request_(std::move(request)),
      retrieval_(std::move(retrieval)),
      chain_(std::move(chain)),
      recorder_(std::move(recorder)),
      queue_(buffer_capacity) {
  if (!retrieval_ || !chain_) {
    throw InvalidParametersError("StreamingSession requires a retrieval engine and a chain");
  }
}

StreamingSession::~StreamingSession() {
  if (producer_.joinable()) {
    cancel();
    producer_.join();
  }
}

void StreamingSession::cancel() {
  std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
  cancelled_ = true;
  queue_.abort();
}

bool StreamingSession::emit(const EventSink &sink, const StreamEvent &event) {
  std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
  if (cancelled_) {
    return false;
  }
  if (!sink(event)) {
    std::cout << "[StreamingSession] consumer went away, cancelling" << std::endl;
    cancel();
    return false;
  }
  return true;
}

bool StreamingSession::emit_terminal(const EventSink &sink,
                                     const StreamEvent &event,
                                     SessionState terminal) {
  std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
  if (cancelled_) {
    return false;
  }
  state_ = terminal;
  sink(event);
  return true;
}

SessionState StreamingSession::fail(const EventSink &sink,
                                    const std::string &kind,
                                    const std::string &message) {
  std::cerr << "[StreamingSession] " << kind << ": " << message << std::endl;
  if (!emit_terminal(sink, StreamEvent::error(kind, message), SessionState::Errored)) {
    return finish_cancelled();
  }
  return state_;
}

SessionState StreamingSession::finish_cancelled() {
  state_ = SessionState::Cancelled;
  if (producer_.joinable()) {
    producer_.join();
  }
  return state_;
}

void StreamingSession::produce(const ContextBundle &bundle) {
  try {
    GenerationResult result = chain_->generate_stream(
        bundle,
        [this](const std::string &fragment) {
          return queue_.push(Item{Item::Kind::Fragment, fragment, ""});
        },
        request_.generation,
        [this](const FallbackNotice &notice) {
          queue_.push(Item{Item::Kind::Notice, notice.message(), ""});
        },
        [this] { return cancelled_.load(); });
    queue_.push(Item{result.stopped ? Item::Kind::Failure : Item::Kind::Done, result.backend,
                     result.stopped ? "cancelled" : ""});
  } catch (const DocqaError &e) {
    queue_.push(Item{Item::Kind::Failure, e.what(), to_string(e.kind())});
  } catch (const std::exception &e) {
    queue_.push(Item{Item::Kind::Failure, e.what(), to_string(ErrorKind::Internal)});
  }
  queue_.close();
}

SessionState StreamingSession::run(const EventSink &sink) {
  if (started_.exchange(true)) {
    throw InvalidParametersError("StreamingSession::run called twice");
  }
  const auto start = std::chrono::steady_clock::now();

  if (cancelled_) {
    return finish_cancelled();
  }

  state_ = SessionState::Searching;
  if (!emit(sink, StreamEvent::status("searching"))) {
    return finish_cancelled();
  }

  try {
    bundle_ = retrieval_->retrieve(request_.owner_id, request_.question, request_.retrieval);
  } catch (const DocqaError &e) {
    return fail(sink, to_string(e.kind()), e.what());
  } catch (const std::exception &e) {
    return fail(sink, to_string(ErrorKind::Internal), e.what());
  }

  if (cancelled_) {
    return finish_cancelled();
  }
  state_ = SessionState::Generating;
  if (!emit(sink, StreamEvent::status("generating"))) {
    return finish_cancelled();
  }

  producer_ = std::thread([this] { produce(bundle_); });

  bool done = false;
  while (auto item = queue_.pop()) {
    if (item->kind == Item::Kind::Fragment) {
      answer_ += item->text;
      if (!emit(sink, StreamEvent::chunk(item->text))) {
        break;
      }
    } else if (item->kind == Item::Kind::Notice) {
      if (!emit(sink, StreamEvent::status(item->text))) {
        break;
      }
    } else if (item->kind == Item::Kind::Done) {
      backend_ = item->text;
      done = true;
      break;
    } else {
      if (item->error_kind == "cancelled") {
        break;
      }
      producer_.join();
      return fail(sink, item->error_kind, item->text);
    }
  }

  if (!done || cancelled_) {
    cancel();
    return finish_cancelled();
  }
  producer_.join();

  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            start)
          .count();
  const int chunks_used = static_cast<int>(bundle_.entries.size());
  if (!emit_terminal(sink, StreamEvent::complete(elapsed_ms, chunks_used),
                     SessionState::Completed)) {
    return finish_cancelled();
  }
  record(elapsed_ms, chunks_used);
  return state_;
}

void StreamingSession::record(long long elapsed_ms, int chunks_used) {
  if (!recorder_) {
    return;
  }
  QueryRecord query;
  query.owner_id = request_.owner_id;
  query.question = request_.question;
  query.answer = answer_;
  query.response_time_ms = elapsed_ms;
  query.chunks_used = chunks_used;
  query.backend = backend_;
  query.created_at = std::chrono::system_clock::now();
  try {
    recorder_->record_query(query);
  } catch (const DocqaError &e) {
    std::cerr << "[StreamingSession] failed to record query: " << e.what() << std::endl;
  }
}

}  // namespace docqa_core
