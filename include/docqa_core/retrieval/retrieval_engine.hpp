#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/retrieval/chunk_resolver.hpp"
#include "docqa_core/types/context_bundle.hpp"

namespace docqa_core {

struct RetrievalOptions {
  size_t top_k = 5;
  size_t max_context_length = 4000;
  SearchFilters filters;
};

/**
 * Question -> ranked context. Embeds the question, searches the owner's
 * partition, resolves chunk text and packs it greedily into the length budget.
 */
class RetrievalEngine {
 public:
  RetrievalEngine(std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<VectorIndex> index,
                  std::shared_ptr<ChunkResolver> resolver,
                  std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(250));

  // Throws InvalidParametersError for a zero k or budget. Embedding and index
  // failures propagate; a failed search is retried once first.
  ContextBundle retrieve(OwnerId owner_id,
                         const std::string &question,
                         const RetrievalOptions &options = {});

 private:
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<ChunkResolver> resolver_;
  std::chrono::milliseconds retry_backoff_;
};

}  // namespace docqa_core
