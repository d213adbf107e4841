#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "docqa_core/generation/fallback_chain.hpp"
#include "docqa_core/retrieval/retrieval_engine.hpp"
#include "docqa_core/types/query_record.hpp"
#include "docqa_core/types/stream_event.hpp"
#include "docqa_core/util/bounded_queue.hpp"

namespace docqa_core {

enum class SessionState { Init, Searching, Generating, Completed, Errored, Cancelled };

std::string to_string(SessionState state);

// Delivers one event to the consumer; false means the consumer is gone
using EventSink = std::function<bool(const StreamEvent &)>;

struct SessionRequest {
  OwnerId owner_id = 0;
  std::string question;
  RetrievalOptions retrieval;
  std::optional<GenerationOptions> generation;
};

/**
 * @brief One streamed question, start to finish.
 *
 * run() drives Init -> Searching -> Generating -> Completed on the calling
 * thread and hands every event to the sink in order. Generation happens on a
 * producer thread that feeds a bounded queue, so a slow consumer stalls the
 * backend instead of buffering without limit.
 *
 * cancel() may be called from any thread. After it, no further collaborator
 * call is started and nothing more is emitted. A cancel() that arrives while
 * the sink is delivering an event waits for that delivery to finish, so the
 * sink must not block on a thread that is itself inside cancel().
 */
class StreamingSession {
 public:
  StreamingSession(SessionRequest request,
                   std::shared_ptr<RetrievalEngine> retrieval,
                   std::shared_ptr<FallbackChain> chain,
                   std::shared_ptr<QueryRecorder> recorder,
                   size_t buffer_capacity = 16);
  ~StreamingSession();

  StreamingSession(const StreamingSession &) = delete;
  StreamingSession &operator=(const StreamingSession &) = delete;

  // Runs to a terminal state and returns it. Call once.
  SessionState run(const EventSink &sink);

  void cancel();

  SessionState state() const {
    return state_.load();
  }

  bool is_cancelled() const {
    return cancelled_.load();
  }

  // Text delivered so far; complete once the session reached Completed
  const std::string &answer() const {
    return answer_;
  }

  const std::string &backend() const {
    return backend_;
  }

 private:
  struct Item {
    enum class Kind { Fragment, Notice, Done, Failure };
    Kind kind;
    std::string text;
    std::string error_kind;
  };

  bool emit(const EventSink &sink, const StreamEvent &event);
  // Sets the terminal state and delivers its event unless cancelled first
  bool emit_terminal(const EventSink &sink, const StreamEvent &event, SessionState terminal);
  SessionState fail(const EventSink &sink, const std::string &kind, const std::string &message);
  SessionState finish_cancelled();
  void produce(const ContextBundle &bundle);
  void record(long long elapsed_ms, int chunks_used);

  SessionRequest request_;
  std::shared_ptr<RetrievalEngine> retrieval_;
  std::shared_ptr<FallbackChain> chain_;
  std::shared_ptr<QueryRecorder> recorder_;

  ContextBundle bundle_;
  BoundedQueue<Item> queue_;
  std::thread producer_;
  std::atomic<SessionState> state_{SessionState::Init};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> started_{false};
  // Held while an event is delivered and while cancel() flips the flag
  std::recursive_mutex emit_mutex_;

  std::string answer_;
  std::string backend_;
};

}  // namespace docqa_core
