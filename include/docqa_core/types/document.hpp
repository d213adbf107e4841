#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace docqa_core {

using OwnerId = std::int64_t;
using DocumentId = std::int64_t;
using ChunkId = std::int64_t;

struct Document {
  DocumentId id = 0;
  OwnerId owner_id = 0;
  std::string filename;
  std::string content_hash;
  int chunk_count = 0;
  size_t file_size = 0;
  std::chrono::system_clock::time_point created_at;
};

}  // namespace docqa_core
