#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "docqa_core/db/connection_pool.hpp"

namespace docqa_core {

/**
 * Owns the schema and the connection pool for one database file. The local
 * vector index and the document store share an instance.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);
  ~DatabaseManager();

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &path() const {
    return db_path_;
  }

 private:
  void setup_schema(const std::string &db_key);

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  std::mutex state_mutex_;
  bool is_running_ = false;
};

}  // namespace docqa_core
