#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

/**
 * @brief In-process vector index backed by FAISS and persisted in SQLite.
 *
 * Each owner gets its own shard, an IndexIDMap2 over an inner-product flat
 * index. Vectors are L2-normalized on the way in, so scores are cosine
 * similarities. A shard is rebuilt from the vectors table the first time the
 * owner is touched. Searches on a shard run concurrently; writes are exclusive.
 */
class LocalVectorIndex : public VectorIndex {
 public:
  LocalVectorIndex(DatabaseManager &db_manager, size_t dimension);

  LocalVectorIndex(const LocalVectorIndex &) = delete;
  LocalVectorIndex &operator=(const LocalVectorIndex &) = delete;

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
    return "local";
  }

  // Number of vectors currently held for an owner
  size_t size(OwnerId owner_id);

 private:
  struct OwnerShard {
    std::shared_mutex mutex;
    std::once_flag loaded;
    std::unique_ptr<faiss::IndexIDMap2> index;
    std::unordered_map<ChunkId, DocumentId> chunk_documents;
  };

  std::shared_ptr<OwnerShard> shard_for(OwnerId owner_id);
  void load_shard(OwnerId owner_id, OwnerShard &shard);
  std::unique_ptr<faiss::IndexIDMap2> create_base_index() const;
  void remove_from_shard(OwnerShard &shard, const std::vector<ChunkId> &chunk_ids);
  std::vector<float> normalized(const std::vector<float> &vector) const;

  DatabaseManager &db_manager_;
  size_t dimension_;
  std::mutex shards_mutex_;
  std::unordered_map<OwnerId, std::shared_ptr<OwnerShard>> shards_;
};

}  // namespace docqa_core
