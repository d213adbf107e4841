#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/util/http_client.hpp"

namespace docqa_core {

struct QdrantConfig {
  std::string url = "http://localhost:6333";
  std::string api_key;
  std::string collection = "documents";
  std::chrono::milliseconds timeout{10000};
};

/**
 * Vector index on a Qdrant collection over its REST API. Owners share one
 * collection; every point carries owner_id in its payload and every request
 * is filtered on it. Scores are Qdrant's cosine similarities.
 */
class QdrantVectorIndex : public VectorIndex {
 public:
  // Creates the collection if missing. Throws IndexUnavailableError when Qdrant is unreachable.
  QdrantVectorIndex(QdrantConfig config, size_t dimension);

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
    return "qdrant";
  }

  // Request bodies; public so the owner scoping can be checked without a server
  static nlohmann::json owner_filter(OwnerId owner_id,
                                     std::optional<ChunkId> chunk_id = std::nullopt,
                                     std::optional<DocumentId> document_id = std::nullopt);
  static nlohmann::json build_upsert_body(OwnerId owner_id, const std::vector<VectorEntry> &entries);
  static nlohmann::json build_search_body(OwnerId owner_id,
                                          const std::vector<float> &query,
                                          size_t k,
                                          const SearchFilters &filters);
  static nlohmann::json build_collection_body(size_t dimension);
  static nlohmann::json build_lookup_body(const std::vector<VectorEntry> &entries);
  // Ids in a points lookup response whose payload names a different owner
  static std::vector<ChunkId> foreign_ids(const nlohmann::json &lookup_response, OwnerId owner_id);

 private:
  void ensure_collection();
  void reject_foreign_ids(OwnerId owner_id, const std::vector<VectorEntry> &entries);
  void delete_points(const nlohmann::json &filter, const std::string &operation);
  HttpResponse send(const std::string &method,
                    const std::string &path,
                    const nlohmann::json *body,
                    const std::string &operation) const;
  void check_dimension(const std::vector<float> &vector) const;

  QdrantConfig config_;
  size_t dimension_;
  std::unique_ptr<HttpClient> http_;
};

}  // namespace docqa_core
