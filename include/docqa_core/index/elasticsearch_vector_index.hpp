#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/util/http_client.hpp"

namespace docqa_core {

struct ElasticsearchConfig {
  std::string url = "http://localhost:9200";
  std::string index = "documents";
  std::string api_key;
  std::chrono::milliseconds timeout{10000};
  // kNN candidate pool per shard, raised to at least k
  size_t num_candidates = 100;
};

/**
 * Vector index on an Elasticsearch dense_vector field with cosine similarity.
 * Document ids embed the owner, and every query carries an owner_id term
 * filter. A non-empty text hint adds a match clause on the chunk text.
 */
class ElasticsearchVectorIndex : public VectorIndex {
 public:
  ElasticsearchVectorIndex(ElasticsearchConfig config, size_t dimension);

  void add(OwnerId owner_id,
           ChunkId chunk_id,
           const std::vector<float> &vector,
           const VectorMetadata &metadata) override;
  void add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries) override;

  std::vector<VectorHit> search(OwnerId owner_id,
                                const std::vector<float> &query,
                                size_t k,
                                const SearchFilters &filters) override;

  void delete_chunk(OwnerId owner_id, ChunkId chunk_id) override;
  void delete_document(OwnerId owner_id, DocumentId document_id) override;
  void delete_all(OwnerId owner_id) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string name() const override {
    return "elasticsearch";
  }

  static std::string document_key(OwnerId owner_id, ChunkId chunk_id);
  static nlohmann::json build_mapping(size_t dimension);
  static std::string build_bulk_body(const std::string &index,
                                     OwnerId owner_id,
                                     const std::vector<VectorEntry> &entries);
  static nlohmann::json build_search_body(OwnerId owner_id,
                                          const std::vector<float> &query,
                                          size_t k,
                                          size_t num_candidates,
                                          const SearchFilters &filters);
  static nlohmann::json build_delete_query(OwnerId owner_id,
                                           std::optional<ChunkId> chunk_id,
                                           std::optional<DocumentId> document_id);
  // Finds documents holding any of these chunk ids under another owner
  static nlohmann::json build_foreign_lookup(OwnerId owner_id,
                                             const std::vector<VectorEntry> &entries);

 private:
  void ensure_index();
  void reject_foreign_ids(OwnerId owner_id, const std::vector<VectorEntry> &entries);
  void delete_by_query(const nlohmann::json &body, const std::string &operation);
  void check_dimension(const std::vector<float> &vector) const;

  ElasticsearchConfig config_;
  size_t dimension_;
  std::unique_ptr<HttpClient> http_;
};

}  // namespace docqa_core
