#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace docqa_core {

enum class StreamEventType { Status, Chunk, Complete, Error };

std::string to_string(StreamEventType type);

struct StreamEvent {
  StreamEventType type = StreamEventType::Status;
  std::string message;     // status text, chunk content or error message
  std::string error_kind;  // set on Error
  long long response_time_ms = 0;
  int chunks_used = 0;

  static StreamEvent status(const std::string &message);
  static StreamEvent chunk(const std::string &content);
  static StreamEvent complete(long long response_time_ms, int chunks_used);
  static StreamEvent error(const std::string &error_kind, const std::string &message);

  // Wire form: {"type": "...", ...} as sent to stream consumers
  nlohmann::json to_json() const;
};

}  // namespace docqa_core
