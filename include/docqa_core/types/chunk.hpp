#pragma once

#include <cstddef>
#include <string>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct ChunkingParams {
  size_t target_size = 1000;
  size_t overlap = 200;
  // How far back from the hard cut the chunker looks for a sentence or line break
  size_t lookback = 100;
};

struct Chunk {
  int chunk_index = 0;
  std::string content;
  std::string content_hash;
  size_t target_size = 0;
  size_t overlap = 0;
  // Code point window in the source text, before whitespace trimming
  size_t start_offset = 0;
  size_t end_offset = 0;
};

// A chunk as persisted by the document store
struct StoredChunk {
  ChunkId id = 0;
  DocumentId document_id = 0;
  OwnerId owner_id = 0;
  int chunk_index = 0;
  std::string content;
};

}  // namespace docqa_core
