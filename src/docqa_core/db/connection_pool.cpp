#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "docqa_core/db/connection_pool.hpp"

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string &db_path,
                                                                  const std::string &db_key) {
  auto db = std::make_unique<sqlite::database>(db_path);
  sqlite3 *handle = db->connection().get();
  if (!handle) {
    throw DocumentStoreError("Failed to get native handle for database " + db_path);
  }

  if (!db_key.empty() &&
      sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw DocumentStoreError("Failed to key database: " + std::string(sqlite3_errmsg(handle)));
  }

  // Fails here rather than on first use when the key is wrong
  *db << "SELECT count(*) FROM sqlite_master;";
  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = 5000;";
  return db;
}

ConnectionPool::ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size)
    : pool_size_(pool_size) {
  if (pool_size <= 0) {
    throw InvalidParametersError("connection pool size must be positive");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_connection(db_path, db_key));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw DocumentStoreError("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
    pool_.pop();
  }
  cv_.notify_all();
}

}  // namespace docqa_core
