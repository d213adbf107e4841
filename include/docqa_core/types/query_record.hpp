#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct QueryRecord {
  std::int64_t id = 0;
  OwnerId owner_id = 0;
  std::string question;
  std::string answer;
  long long response_time_ms = 0;
  int chunks_used = 0;
  std::string backend;
  std::chrono::system_clock::time_point created_at;
};

// Sink for completed question/answer exchanges
class QueryRecorder {
 public:
  virtual ~QueryRecorder() = default;
  virtual std::int64_t record_query(const QueryRecord &record) = 0;
};

}  // namespace docqa_core
