#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "docqa_core/db/connection_pool.hpp"
#include "docqa_core/db/pooled_connection.hpp"

namespace docqa_core {

class DatabaseManagerTest : public docqa_tests::DocumentStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"documents", "chunks", "vectors", "query_logs"};

  PooledConnection conn(*db_manager_);
  for (const auto &table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name='idx_vectors_owner_document'" >>
      idx_count;
  EXPECT_EQ(idx_count, 1);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({ ConnectionPool bad_pool(temp_db_path_.string(), wrong_key, 1); }, std::exception);
}

TEST_F(DatabaseManagerTest, ReopenWithSameKey_KeepsData) {
  document_store_->insert_document(docqa_tests::TestUtilities::create_test_document(1), {});
  document_store_.reset();
  db_manager_->shutdown();

  db_manager_ = std::make_unique<DatabaseManager>(temp_db_path_, "docqa_test_key", 2);
  DocumentStore reopened(*db_manager_);
  EXPECT_EQ(reopened.count_documents(1), 1);
}

}  // namespace docqa_core
