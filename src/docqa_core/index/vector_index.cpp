#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

void VectorIndex::add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries) {
  for (const auto &entry : entries) {
    add(owner_id, entry.chunk_id, entry.vector, entry.metadata);
  }
}

}  // namespace docqa_core
