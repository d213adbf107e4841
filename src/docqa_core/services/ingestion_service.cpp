#include "docqa_core/services/ingestion_service.hpp"

#include <algorithm>
#include <iostream>

#include "docqa_core/chunking/text_chunker.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/util/hashing.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

IngestionService::IngestionService(std::shared_ptr<DocumentStore> store,
                                   std::shared_ptr<EmbeddingProvider> embedder,
                                   std::shared_ptr<VectorIndex> index,
                                   IngestionLimits limits)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      index_(std::move(index)),
      limits_(limits) {
  if (!store_ || !embedder_ || !index_) {
    throw InvalidParametersError("IngestionService requires a store, an embedder and an index");
  }
  if (embedder_->dimension() != index_->dimension()) {
    throw InvalidParametersError("embedding dimension " + std::to_string(embedder_->dimension()) +
                                 " does not match index dimension " +
                                 std::to_string(index_->dimension()));
  }
}

IngestResult IngestionService::ingest(const IngestRequest &request) {
  if (text::is_blank(request.text)) {
    throw InvalidParametersError("document has no text content");
  }
  TextChunker chunker(request.chunking);

  const std::string text = text::sanitize_utf8(request.text);
  const std::string &raw = request.raw_bytes ? *request.raw_bytes : request.text;
  const std::string content_hash = sha256_hex(raw);

  auto guard = ingest_locks_.acquire(std::to_string(request.owner_id) + ":" + content_hash);

  if (auto existing = store_->find_by_hash(request.owner_id, content_hash)) {
    std::cout << "[IngestionService] owner " << request.owner_id << " already has "
              << content_hash.substr(0, 12) << " as document " << existing->id << std::endl;
    return IngestResult{existing->id, existing->chunk_count, content_hash, true};
  }

  if (store_->count_documents(request.owner_id) >= limits_.max_documents_per_owner) {
    throw LimitExceededError("document limit of " +
                             std::to_string(limits_.max_documents_per_owner) + " reached");
  }

  std::vector<Chunk> chunks = chunker.chunk(text);
  if (chunks.empty()) {
    throw InvalidParametersError("document produced no chunks");
  }
  if (static_cast<int>(chunks.size()) > limits_.max_chunks_per_document) {
    throw LimitExceededError("document has " + std::to_string(chunks.size()) +
                             " chunks, limit is " +
                             std::to_string(limits_.max_chunks_per_document));
  }

  // Embedded kEmbeddingBatchSize chunks at a time
  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());
  for (size_t begin = 0; begin < chunks.size(); begin += kEmbeddingBatchSize) {
    const size_t end = std::min(begin + kEmbeddingBatchSize, chunks.size());
    std::vector<std::string> batch;
    for (size_t i = begin; i < end; ++i) {
      batch.push_back(chunks[i].content);
    }
    for (auto &vector : embedder_->embed_many(batch)) {
      vectors.push_back(std::move(vector));
    }
  }

  Document document;
  document.owner_id = request.owner_id;
  document.filename = request.filename;
  document.content_hash = content_hash;
  document.chunk_count = static_cast<int>(chunks.size());
  document.file_size = raw.size();
  document.created_at = std::chrono::system_clock::now();

  // The limit is checked again inside the insert transaction
  StoredDocument stored =
      store_->insert_document(document, chunks, limits_.max_documents_per_owner);

  std::vector<VectorEntry> entries;
  entries.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    entries.push_back({stored.chunk_ids[i], std::move(vectors[i]),
                       {stored.document.id, chunks[i].chunk_index, chunks[i].content}});
  }

  try {
    index_->add_batch(request.owner_id, entries);
  } catch (const DocqaError &e) {
    std::cerr << "[IngestionService] indexing document " << stored.document.id
              << " failed, rolling back: " << e.what() << std::endl;
    try {
      index_->delete_document(request.owner_id, stored.document.id);
    } catch (const DocqaError &cleanup_error) {
      std::cerr << "[IngestionService] index cleanup failed: " << cleanup_error.what()
                << std::endl;
    }
    store_->delete_document(request.owner_id, stored.document.id);
    throw;
  }

  std::cout << "[IngestionService] ingested '" << request.filename << "' for owner "
            << request.owner_id << ": document " << stored.document.id << ", "
            << chunks.size() << " chunks" << std::endl;
  return IngestResult{stored.document.id, document.chunk_count, content_hash, false};
}

bool IngestionService::delete_document(OwnerId owner_id, DocumentId document_id) {
  // Vectors go first so no search hit can point at removed text
  index_->delete_document(owner_id, document_id);
  return store_->delete_document(owner_id, document_id);
}

int IngestionService::delete_all(OwnerId owner_id) {
  index_->delete_all(owner_id);
  const int removed = store_->delete_owner_data(owner_id);
  std::cout << "[IngestionService] wiped owner " << owner_id << ": " << removed << " documents"
            << std::endl;
  return removed;
}

std::vector<Document> IngestionService::list_documents(OwnerId owner_id) {
  return store_->list_documents(owner_id);
}

}  // namespace docqa_core
