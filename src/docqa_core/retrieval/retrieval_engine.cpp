#include "docqa_core/retrieval/retrieval_engine.hpp"

#include <algorithm>
#include <unordered_map>

#include "docqa_core/errors.hpp"
#include "docqa_core/util/retry.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

RetrievalEngine::RetrievalEngine(std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<VectorIndex> index,
                                 std::shared_ptr<ChunkResolver> resolver,
                                 std::chrono::milliseconds retry_backoff)
    : embedder_(std::move(embedder)),
      index_(std::move(index)),
      resolver_(std::move(resolver)),
      retry_backoff_(retry_backoff) {
  if (!embedder_ || !index_ || !resolver_) {
    throw InvalidParametersError("RetrievalEngine requires an embedder, an index and a resolver");
  }
}

ContextBundle RetrievalEngine::retrieve(OwnerId owner_id,
                                       const std::string &question,
                                       const RetrievalOptions &options) {
  if (options.top_k == 0) {
    throw InvalidParametersError("k must be positive");
  }
  if (options.max_context_length == 0) {
    throw InvalidParametersError("max_context_length must be positive");
  }

  ContextBundle bundle;
  bundle.question = question;

  const std::vector<float> query = embedder_->embed(question);

  const std::vector<VectorHit> hits =
      retry_once<IndexUnavailableError>("vector search on " + index_->name(), retry_backoff_, [&] {
        return index_->search(owner_id, query, options.top_k, options.filters);
      });
  if (hits.empty()) {
    return bundle;
  }

  std::vector<ChunkId> ids;
  ids.reserve(hits.size());
  std::unordered_map<ChunkId, float> scores;
  for (const auto &hit : hits) {
    ids.push_back(hit.chunk_id);
    scores[hit.chunk_id] = hit.score;
  }

  std::vector<ContextEntry> entries;
  for (auto &chunk : resolver_->resolve_chunks(owner_id, ids)) {
    ContextEntry entry;
    entry.chunk_id = chunk.id;
    entry.document_id = chunk.document_id;
    entry.chunk_index = chunk.chunk_index;
    entry.score = scores[chunk.id];
    entry.text = std::move(chunk.content);
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const ContextEntry &a, const ContextEntry &b) {
    if (a.score != b.score)
      return a.score > b.score;
    if (a.document_id != b.document_id)
      return a.document_id < b.document_id;
    return a.chunk_index < b.chunk_index;
  });

  // Greedy packing; the first chunk that does not fit ends the bundle
  for (auto &entry : entries) {
    const size_t length = text::code_point_length(entry.text);
    if (bundle.total_length + length > options.max_context_length) {
      break;
    }
    bundle.total_length += length;
    bundle.entries.push_back(std::move(entry));
  }
  return bundle;
}

}  // namespace docqa_core
