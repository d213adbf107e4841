#include "docqa_core/types/context_bundle.hpp"
#include "docqa_core/types/stream_event.hpp"

namespace docqa_core {

std::vector<std::string> ContextBundle::texts() const {
  std::vector<std::string> out;
  out.reserve(entries.size());
  for (const auto &entry : entries) {
    out.push_back(entry.text);
  }
  return out;
}

std::vector<ChunkId> ContextBundle::chunk_ids() const {
  std::vector<ChunkId> out;
  out.reserve(entries.size());
  for (const auto &entry : entries) {
    out.push_back(entry.chunk_id);
  }
  return out;
}

std::string to_string(StreamEventType type) {
  switch (type) {
    case StreamEventType::Status:
      return "status";
    case StreamEventType::Chunk:
      return "chunk";
    case StreamEventType::Complete:
      return "complete";
    case StreamEventType::Error:
      return "error";
    default:
      return "unknown";
  }
}

StreamEvent StreamEvent::status(const std::string &message) {
  StreamEvent event;
  event.type = StreamEventType::Status;
  event.message = message;
  return event;
}

StreamEvent StreamEvent::chunk(const std::string &content) {
  StreamEvent event;
  event.type = StreamEventType::Chunk;
  event.message = content;
  return event;
}

StreamEvent StreamEvent::complete(long long response_time_ms, int chunks_used) {
  StreamEvent event;
  event.type = StreamEventType::Complete;
  event.response_time_ms = response_time_ms;
  event.chunks_used = chunks_used;
  return event;
}

StreamEvent StreamEvent::error(const std::string &error_kind, const std::string &message) {
  StreamEvent event;
  event.type = StreamEventType::Error;
  event.error_kind = error_kind;
  event.message = message;
  return event;
}

nlohmann::json StreamEvent::to_json() const {
  nlohmann::json j;
  j["type"] = to_string(type);
  switch (type) {
    case StreamEventType::Status:
      j["message"] = message;
      break;
    case StreamEventType::Chunk:
      j["content"] = message;
      break;
    case StreamEventType::Complete:
      j["response_time"] = response_time_ms;
      j["chunks_used"] = chunks_used;
      break;
    case StreamEventType::Error:
      j["kind"] = error_kind;
      j["message"] = message;
      break;
  }
  return j;
}

}  // namespace docqa_core
