#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docqa_core {

class ConnectionPool {
 public:
  // An empty db_key opens the database unencrypted
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  // Blocks until a connection is free. Throws once shut down.
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  int size() const {
    return pool_size_;
  }

  // Opens, keys and configures one connection
  static std::unique_ptr<sqlite::database> open_connection(const std::string &db_path,
                                                           const std::string &db_key);

 private:
  bool shutting_down_ = false;
  int pool_size_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docqa_core
