#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/db/document_store.hpp"
#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/context_bundle.hpp"
#include "docqa_core/types/document.hpp"

namespace docqa_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path &db_path);

  // Test data creation
  static docqa_core::Document create_test_document(docqa_core::OwnerId owner_id,
                                                   const std::string &filename = "notes.txt",
                                                   const std::string &content_hash = "default_hash",
                                                   int chunk_count = 0);

  static std::vector<docqa_core::Chunk> create_test_chunks(
      int count, const std::string &base_content = "test content");

  // Unit vector along one axis
  static std::vector<float> axis_vector(size_t dimension, size_t axis);

  static docqa_core::ContextBundle create_test_bundle(const std::string &question,
                                                      const std::vector<std::string> &texts);

  // Text of roughly the given length in code points, made of numbered sentences
  static std::string create_sentences(size_t approx_length);
};

/**
 * Base fixture with a fresh encrypted database and a DocumentStore per test
 */
class DocumentStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    const std::string test_db_key = "docqa_test_key";
    db_manager_ = std::make_unique<docqa_core::DatabaseManager>(temp_db_path_, test_db_key,
                                                                /*pool_size*/ 4);
    document_store_ = std::make_shared<docqa_core::DocumentStore>(*db_manager_);
  }

  void TearDown() override {
    document_store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<docqa_core::DatabaseManager> db_manager_;
  std::shared_ptr<docqa_core::DocumentStore> document_store_;
};

}  // namespace docqa_tests
