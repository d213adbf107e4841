#include "docqa_core/db/document_store.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/db/transaction.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/services/compression_service.hpp"

namespace docqa_core {

namespace {

Document make_document(int64_t id,
                       int64_t owner_id,
                       std::string filename,
                       std::string content_hash,
                       int chunk_count,
                       int64_t file_size) {
  Document document;
  document.id = id;
  document.owner_id = owner_id;
  document.filename = std::move(filename);
  document.content_hash = std::move(content_hash);
  document.chunk_count = chunk_count;
  document.file_size = static_cast<size_t>(file_size);
  return document;
}

}  // namespace

std::string DocumentStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point DocumentStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw DocumentStoreError("Failed to parse time string: " + time_str +
                             ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // Stored as UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string DocumentStore::id_list(const std::vector<ChunkId> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

DocumentStore::DocumentStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::optional<Document> DocumentStore::find_by_hash(OwnerId owner_id,
                                                    const std::string &content_hash) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, filename, content_hash, chunk_count, file_size, created_at "
             "FROM documents WHERE owner_id = ? AND content_hash = ?"
          << owner_id << content_hash >>
        [&](int64_t id, int64_t owner, std::string filename, std::string hash, int chunk_count,
            int64_t file_size, std::string created_at) {
          Document document = make_document(id, owner, std::move(filename), std::move(hash),
                                            chunk_count, file_size);
          document.created_at = string_to_time_point(created_at);
          result = std::move(document);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("find_by_hash", e));
  }
}

std::optional<Document> DocumentStore::get_document(OwnerId owner_id, DocumentId document_id) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, filename, content_hash, chunk_count, file_size, created_at "
             "FROM documents WHERE owner_id = ? AND id = ?"
          << owner_id << document_id >>
        [&](int64_t id, int64_t owner, std::string filename, std::string hash, int chunk_count,
            int64_t file_size, std::string created_at) {
          Document document = make_document(id, owner, std::move(filename), std::move(hash),
                                            chunk_count, file_size);
          document.created_at = string_to_time_point(created_at);
          result = std::move(document);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_document", e));
  }
}

std::vector<Document> DocumentStore::list_documents(OwnerId owner_id) {
  std::vector<Document> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, filename, content_hash, chunk_count, file_size, created_at "
             "FROM documents WHERE owner_id = ? ORDER BY id DESC"
          << owner_id >>
        [&](int64_t id, int64_t owner, std::string filename, std::string hash, int chunk_count,
            int64_t file_size, std::string created_at) {
          Document document = make_document(id, owner, std::move(filename), std::move(hash),
                                            chunk_count, file_size);
          document.created_at = string_to_time_point(created_at);
          documents.push_back(std::move(document));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("list_documents", e));
  }
  return documents;
}

int DocumentStore::count_documents(OwnerId owner_id) {
  try {
    int count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM documents WHERE owner_id = ?" << owner_id >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("count_documents", e));
  }
}

StoredDocument DocumentStore::insert_document(const Document &document,
                                              const std::vector<Chunk> &chunks,
                                              std::optional<int> max_documents) {
  StoredDocument stored;
  stored.document = document;
  stored.document.chunk_count = static_cast<int>(chunks.size());
  if (stored.document.created_at == std::chrono::system_clock::time_point{}) {
    stored.document.created_at = std::chrono::system_clock::now();
  }

  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);

    if (max_documents) {
      int existing = 0;
      *conn << "SELECT COUNT(*) FROM documents WHERE owner_id = ?" << document.owner_id >>
          existing;
      if (existing >= *max_documents) {
        throw LimitExceededError("document limit of " + std::to_string(*max_documents) +
                                 " reached");
      }
    }

    *conn << "INSERT INTO documents (owner_id, filename, content_hash, chunk_count, file_size, "
             "created_at) VALUES (?, ?, ?, ?, ?, ?)"
          << document.owner_id << document.filename << document.content_hash
          << stored.document.chunk_count << static_cast<int64_t>(document.file_size)
          << time_point_to_string(stored.document.created_at);
    stored.document.id = conn->last_insert_rowid();

    stored.chunk_ids.reserve(chunks.size());
    for (const auto &chunk : chunks) {
      std::vector<char> compressed = CompressionService::compress(chunk.content);
      *conn << "INSERT INTO chunks (document_id, owner_id, chunk_index, content, content_hash, "
               "target_size, overlap) VALUES (?, ?, ?, ?, ?, ?, ?)"
            << stored.document.id << document.owner_id << chunk.chunk_index << compressed
            << chunk.content_hash << static_cast<int64_t>(chunk.target_size)
            << static_cast<int64_t>(chunk.overlap);
      stored.chunk_ids.push_back(conn->last_insert_rowid());
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    if (is_unique_violation(e)) {
      throw DocumentStoreError("Document with hash " + document.content_hash +
                               " already exists for owner " + std::to_string(document.owner_id));
    }
    throw DocumentStoreError(format_db_error("insert_document", e));
  }
  return stored;
}

bool DocumentStore::delete_document(OwnerId owner_id, DocumentId document_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM documents WHERE owner_id = ? AND id = ?" << owner_id << document_id;
    return conn->rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("delete_document", e));
  }
}

int DocumentStore::delete_owner_data(OwnerId owner_id) {
  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    *conn << "DELETE FROM documents WHERE owner_id = ?" << owner_id;
    const int removed = conn->rows_modified();
    // Chunks cascade from documents; cleared explicitly in case foreign keys are off
    *conn << "DELETE FROM chunks WHERE owner_id = ?" << owner_id;
    *conn << "DELETE FROM query_logs WHERE owner_id = ?" << owner_id;
    tx.commit();
    return removed;
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("delete_owner_data", e));
  }
}

std::vector<StoredChunk> DocumentStore::get_document_chunks(OwnerId owner_id,
                                                            DocumentId document_id) {
  std::vector<StoredChunk> chunks;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, document_id, owner_id, chunk_index, content FROM chunks "
             "WHERE owner_id = ? AND document_id = ? ORDER BY chunk_index"
          << owner_id << document_id >>
        [&](int64_t id, int64_t doc_id, int64_t owner, int chunk_index,
            std::vector<char> content) {
          StoredChunk chunk;
          chunk.id = id;
          chunk.document_id = doc_id;
          chunk.owner_id = owner;
          chunk.chunk_index = chunk_index;
          chunk.content = CompressionService::decompress(content);
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("get_document_chunks", e));
  }
  return chunks;
}

std::vector<StoredChunk> DocumentStore::resolve_chunks(OwnerId owner_id,
                                                       const std::vector<ChunkId> &chunk_ids) {
  if (chunk_ids.empty()) {
    return {};
  }

  std::unordered_map<ChunkId, StoredChunk> by_id;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, document_id, owner_id, chunk_index, content FROM chunks "
             "WHERE owner_id = ? AND id IN (" +
                 id_list(chunk_ids) + ")"
          << owner_id >>
        [&](int64_t id, int64_t doc_id, int64_t owner, int chunk_index,
            std::vector<char> content) {
          StoredChunk chunk;
          chunk.id = id;
          chunk.document_id = doc_id;
          chunk.owner_id = owner;
          chunk.chunk_index = chunk_index;
          chunk.content = CompressionService::decompress(content);
          by_id[id] = std::move(chunk);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("resolve_chunks", e));
  }

  // Keep the caller's order
  std::vector<StoredChunk> out;
  out.reserve(by_id.size());
  for (ChunkId id : chunk_ids) {
    auto it = by_id.find(id);
    if (it != by_id.end()) {
      out.push_back(std::move(it->second));
      by_id.erase(it);
    } else {
      std::cerr << "Warning: chunk " << id << " not found for owner " << owner_id << std::endl;
    }
  }
  return out;
}

std::int64_t DocumentStore::record_query(const QueryRecord &record) {
  const auto created_at = record.created_at == std::chrono::system_clock::time_point{}
                              ? std::chrono::system_clock::now()
                              : record.created_at;
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT INTO query_logs (owner_id, question, answer, response_time_ms, chunks_used, "
             "backend, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
          << record.owner_id << record.question << record.answer
          << static_cast<int64_t>(record.response_time_ms) << record.chunks_used << record.backend
          << time_point_to_string(created_at);
    return conn->last_insert_rowid();
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("record_query", e));
  }
}

std::vector<QueryRecord> DocumentStore::list_queries(OwnerId owner_id, int limit) {
  if (limit <= 0) {
    throw InvalidParametersError("history limit must be positive");
  }
  std::vector<QueryRecord> records;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, owner_id, question, answer, response_time_ms, chunks_used, backend, "
             "created_at FROM query_logs WHERE owner_id = ? ORDER BY id DESC LIMIT ?"
          << owner_id << limit >>
        [&](int64_t id, int64_t owner, std::string question, std::string answer,
            int64_t response_time_ms, int chunks_used, std::string backend,
            std::string created_at) {
          QueryRecord record;
          record.id = id;
          record.owner_id = owner;
          record.question = std::move(question);
          record.answer = std::move(answer);
          record.response_time_ms = response_time_ms;
          record.chunks_used = chunks_used;
          record.backend = std::move(backend);
          record.created_at = string_to_time_point(created_at);
          records.push_back(std::move(record));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("list_queries", e));
  }
  return records;
}

int DocumentStore::count_queries_since(OwnerId owner_id,
                                       const std::chrono::system_clock::time_point &since) {
  return query_usage_since(owner_id, since).total_queries;
}

QueryUsage DocumentStore::query_usage_since(OwnerId owner_id,
                                            const std::chrono::system_clock::time_point &since) {
  QueryUsage usage;
  try {
    PooledConnection conn(db_manager_);
    // created_at strings compare in time order
    *conn << "SELECT COUNT(*), CAST(COALESCE(AVG(response_time_ms), 0) AS INTEGER) "
             "FROM query_logs WHERE owner_id = ? AND created_at >= ?"
          << owner_id << time_point_to_string(since) >>
        [&](int total, int64_t avg_ms) {
          usage.total_queries = total;
          usage.avg_response_time_ms = avg_ms;
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("query_usage_since", e));
  }
  return usage;
}

}  // namespace docqa_core
