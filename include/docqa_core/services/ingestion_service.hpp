#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/db/document_store.hpp"
#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/chunk.hpp"
#include "docqa_core/util/keyed_mutex.hpp"

namespace docqa_core {

struct IngestRequest {
  OwnerId owner_id = 0;
  std::string filename;
  // Decoded document text
  std::string text;
  // Original upload bytes; the fingerprint is taken over these when present
  std::optional<std::string> raw_bytes;
  ChunkingParams chunking;
};

struct IngestResult {
  DocumentId document_id = 0;
  int chunk_count = 0;
  std::string content_hash;
  // True when the owner already had identical content; nothing was written
  bool duplicate = false;
};

struct IngestionLimits {
  int max_documents_per_owner = 100;
  int max_chunks_per_document = 1000;
};

/**
 * Document text -> chunks -> vectors, persisted in the document store and the
 * vector index. Uploads with the same owner and fingerprint are serialized so
 * concurrent duplicates produce exactly one document.
 */
class IngestionService {
 public:
  static constexpr size_t kEmbeddingBatchSize = 64;

  IngestionService(std::shared_ptr<DocumentStore> store,
                   std::shared_ptr<EmbeddingProvider> embedder,
                   std::shared_ptr<VectorIndex> index,
                   IngestionLimits limits = {});

  IngestResult ingest(const IngestRequest &request);

  // Idempotent; returns false when the document did not exist
  bool delete_document(OwnerId owner_id, DocumentId document_id);

  // Removes every document, vector and history entry of the owner
  int delete_all(OwnerId owner_id);

  std::vector<Document> list_documents(OwnerId owner_id);

 private:
  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndex> index_;
  IngestionLimits limits_;
  KeyedMutex ingest_locks_;
};

}  // namespace docqa_core
