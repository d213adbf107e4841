#pragma once

#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// Turns chunk ids from the vector index back into text
class ChunkResolver {
 public:
  virtual ~ChunkResolver() = default;

  // Ids that do not exist or belong to another owner are left out
  virtual std::vector<StoredChunk> resolve_chunks(OwnerId owner_id,
                                                  const std::vector<ChunkId> &chunk_ids) = 0;
};

}  // namespace docqa_core
