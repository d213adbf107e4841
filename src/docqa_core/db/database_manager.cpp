#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "docqa_core/db/database_manager.hpp"

#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  try {
    // Schema first, on a single non-pooled connection
    setup_schema(db_key);
    pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key, pool_size);
  } catch (const sqlite::sqlite_exception &e) {
    throw DocumentStoreError(format_db_error("open database " + db_path_.string(), e));
  }
  is_running_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!is_running_) {
    return;
  }
  pool_->shutdown();
  is_running_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!is_running_) {
      throw DocumentStoreError("DatabaseManager has been shut down");
    }
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::string &db_key) {
  auto db = ConnectionPool::open_connection(db_path_.string(), db_key);

  *db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          owner_id INTEGER NOT NULL,
          filename TEXT NOT NULL,
          content_hash TEXT NOT NULL,
          chunk_count INTEGER NOT NULL DEFAULT 0,
          file_size INTEGER NOT NULL,
          created_at TEXT NOT NULL,
          UNIQUE (owner_id, content_hash)
      )
    )";

  // Chunk text is zstd-compressed
  *db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id INTEGER NOT NULL,
          owner_id INTEGER NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          content_hash TEXT NOT NULL,
          target_size INTEGER NOT NULL,
          overlap INTEGER NOT NULL,
          UNIQUE (document_id, chunk_index),
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  // Backing store of the local vector index; keyed by chunk id, no FK so the
  // index can be exercised on its own
  *db << R"(
      CREATE TABLE IF NOT EXISTS vectors (
          chunk_id INTEGER PRIMARY KEY,
          owner_id INTEGER NOT NULL,
          document_id INTEGER NOT NULL,
          chunk_index INTEGER NOT NULL,
          vector_blob BLOB NOT NULL
      )
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS query_logs (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          owner_id INTEGER NOT NULL,
          question TEXT NOT NULL,
          answer TEXT NOT NULL,
          response_time_ms INTEGER NOT NULL,
          chunks_used INTEGER NOT NULL,
          backend TEXT NOT NULL,
          created_at TEXT NOT NULL
      )
    )";

  *db << "CREATE INDEX IF NOT EXISTS idx_documents_owner ON documents(owner_id)";
  *db << "CREATE INDEX IF NOT EXISTS idx_chunks_owner ON chunks(owner_id)";
  *db << "CREATE INDEX IF NOT EXISTS idx_vectors_owner_document ON vectors(owner_id, document_id)";
  *db << "CREATE INDEX IF NOT EXISTS idx_query_logs_owner ON query_logs(owner_id, created_at)";
}

}  // namespace docqa_core
