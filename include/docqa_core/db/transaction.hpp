#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace docqa_core {

/**
 * Write transaction on a pooled connection. Takes the RESERVED lock up front
 * (BEGIN IMMEDIATE); a competing writer waits up to busy_timeout. Anything not
 * committed is rolled back when the guard leaves scope.
 */
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database &db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~WriteTransaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "[WriteTransaction] rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace docqa_core
