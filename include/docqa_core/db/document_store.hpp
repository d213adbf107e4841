#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/retrieval/chunk_resolver.hpp"
#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/document.hpp"
#include "docqa_core/types/query_record.hpp"

namespace docqa_core {

// Query history of one owner over a time window
struct QueryUsage {
  int total_queries = 0;
  long long avg_response_time_ms = 0;
};

struct StoredDocument {
  Document document;
  // Parallel to the chunks passed to insert_document
  std::vector<ChunkId> chunk_ids;
};

/**
 * Documents, their chunk text and the per-owner query history. Every read and
 * write is scoped by owner id. Errors surface as DocumentStoreError.
 */
class DocumentStore : public ChunkResolver, public QueryRecorder {
 public:
  explicit DocumentStore(DatabaseManager &db_manager);

  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;

  std::optional<Document> find_by_hash(OwnerId owner_id, const std::string &content_hash);
  std::optional<Document> get_document(OwnerId owner_id, DocumentId document_id);
  std::vector<Document> list_documents(OwnerId owner_id);
  int count_documents(OwnerId owner_id);

  // Document row and all chunk rows in one transaction. With max_documents set,
  // throws LimitExceededError if the owner already holds that many documents.
  StoredDocument insert_document(const Document &document,
                                 const std::vector<Chunk> &chunks,
                                 std::optional<int> max_documents = std::nullopt);

  // Returns false if nothing matched
  bool delete_document(OwnerId owner_id, DocumentId document_id);

  // Documents, chunks and query history of one owner; returns the number of documents removed
  int delete_owner_data(OwnerId owner_id);

  std::vector<StoredChunk> get_document_chunks(OwnerId owner_id, DocumentId document_id);
  std::vector<StoredChunk> resolve_chunks(OwnerId owner_id,
                                          const std::vector<ChunkId> &chunk_ids) override;

  std::int64_t record_query(const QueryRecord &record) override;

  // Newest first
  std::vector<QueryRecord> list_queries(OwnerId owner_id, int limit);

  int count_queries_since(OwnerId owner_id, const std::chrono::system_clock::time_point &since);
  QueryUsage query_usage_since(OwnerId owner_id,
                               const std::chrono::system_clock::time_point &since);

  // UTC, "YYYY-MM-DD HH:MM:SS"
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);

 private:
  DatabaseManager &db_manager_;

  static std::string id_list(const std::vector<ChunkId> &ids);
};

}  // namespace docqa_core
