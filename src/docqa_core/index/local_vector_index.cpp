#include "docqa_core/index/local_vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <optional>
#include <unordered_set>

#include "docqa_core/db/pooled_connection.hpp"
#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/db/transaction.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

}  // namespace

LocalVectorIndex::LocalVectorIndex(DatabaseManager &db_manager, size_t dimension)
    : db_manager_(db_manager), dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidParametersError("vector dimension must be positive");
  }
}

std::unique_ptr<faiss::IndexIDMap2> LocalVectorIndex::create_base_index() const {
  auto index = std::make_unique<faiss::IndexIDMap2>(
      new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension_)));
  index->own_fields = true;
  return index;
}

std::vector<float> LocalVectorIndex::normalized(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw InvalidParametersError("Vector dimension mismatch. Expected " +
                                 std::to_string(dimension_) + ", got " +
                                 std::to_string(vector.size()));
  }
  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  std::vector<float> out(vector);
  if (norm > 0.0) {
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float &v : out) {
      v *= inv;
    }
  }
  return out;
}

std::shared_ptr<LocalVectorIndex::OwnerShard> LocalVectorIndex::shard_for(OwnerId owner_id) {
  std::shared_ptr<OwnerShard> shard;
  {
    std::lock_guard<std::mutex> lock(shards_mutex_);
    auto &slot = shards_[owner_id];
    if (!slot) {
      slot = std::make_shared<OwnerShard>();
    }
    shard = slot;
  }
  // A throwing load leaves the flag unset, so the next caller retries
  std::call_once(shard->loaded, [&] { load_shard(owner_id, *shard); });
  return shard;
}

void LocalVectorIndex::load_shard(OwnerId owner_id, OwnerShard &shard) {
  std::unique_lock<std::shared_mutex> lock(shard.mutex);
  auto index = create_base_index();
  std::unordered_map<ChunkId, DocumentId> chunk_documents;
  std::vector<faiss::idx_t> ids;
  std::vector<float> flat;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT chunk_id, document_id, vector_blob FROM vectors WHERE owner_id = ?"
          << owner_id >>
        [&](int64_t chunk_id, int64_t document_id, std::vector<char> vector_blob) {
          if (vector_blob.size() != dimension_ * sizeof(float)) {
            std::cerr << "Warning: Skipping chunk ID " << chunk_id
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << dimension_ * sizeof(float) << " bytes, got " << vector_blob.size()
                      << " bytes." << std::endl;
            return;
          }
          const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
          flat.insert(flat.end(), vec_ptr, vec_ptr + dimension_);
          ids.push_back(chunk_id);
          chunk_documents[chunk_id] = document_id;
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("load vectors for owner " +
                                                    std::to_string(owner_id),
                                                e));
  } catch (const DocumentStoreError &e) {
    throw IndexUnavailableError(e.what());
  }

  try {
    if (!ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(ids.size()), flat.data(), ids.data());
    }
  } catch (const faiss::FaissException &e) {
    throw IndexUnavailableError("Failed to rebuild index for owner " + std::to_string(owner_id) +
                                ": " + e.what());
  }

  shard.index = std::move(index);
  shard.chunk_documents = std::move(chunk_documents);
}

void LocalVectorIndex::remove_from_shard(OwnerShard &shard, const std::vector<ChunkId> &chunk_ids) {
  std::vector<faiss::idx_t> present;
  for (ChunkId id : chunk_ids) {
    if (shard.chunk_documents.erase(id) > 0) {
      present.push_back(id);
    }
  }
  if (present.empty()) {
    return;
  }
  faiss::IDSelectorBatch selector(present.size(), present.data());
  shard.index->remove_ids(selector);
}

void LocalVectorIndex::add(OwnerId owner_id,
                           ChunkId chunk_id,
                           const std::vector<float> &vector,
                           const VectorMetadata &metadata) {
  VectorEntry entry;
  entry.chunk_id = chunk_id;
  entry.vector = vector;
  entry.metadata = metadata;
  add_batch(owner_id, {entry});
}

void LocalVectorIndex::add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries) {
  if (entries.empty()) {
    return;
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(entries.size());
  for (const auto &entry : entries) {
    vectors.push_back(normalized(entry.vector));
  }

  auto shard = shard_for(owner_id);
  std::unique_lock<std::shared_mutex> lock(shard->mutex);

  try {
    PooledConnection conn(db_manager_);
    WriteTransaction tx(*conn);
    // A chunk id owned by someone else rejects the whole batch before the shard changes
    for (const auto &entry : entries) {
      std::optional<OwnerId> holder;
      *conn << "SELECT owner_id FROM vectors WHERE chunk_id = ?" << entry.chunk_id >>
          [&](OwnerId existing) { holder = existing; };
      if (holder && *holder != owner_id) {
        throw InvalidParametersError("chunk id " + std::to_string(entry.chunk_id) +
                                     " belongs to another owner");
      }
    }
    for (size_t i = 0; i < entries.size(); ++i) {
      *conn << "INSERT INTO vectors (chunk_id, owner_id, document_id, chunk_index, vector_blob) "
               "VALUES (?, ?, ?, ?, ?) ON CONFLICT(chunk_id) DO UPDATE SET "
               "document_id = excluded.document_id, chunk_index = excluded.chunk_index, "
               "vector_blob = excluded.vector_blob"
            << entries[i].chunk_id << owner_id << entries[i].metadata.document_id
            << entries[i].metadata.chunk_index << to_blob(vectors[i]);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("add vectors", e));
  } catch (const DocumentStoreError &e) {
    throw IndexUnavailableError(e.what());
  }

  try {
    std::vector<ChunkId> ids;
    ids.reserve(entries.size());
    for (const auto &entry : entries) {
      ids.push_back(entry.chunk_id);
    }
    remove_from_shard(*shard, ids);

    std::vector<float> flat;
    flat.reserve(entries.size() * dimension_);
    for (const auto &vec : vectors) {
      flat.insert(flat.end(), vec.begin(), vec.end());
    }
    std::vector<faiss::idx_t> labels(ids.begin(), ids.end());
    shard->index->add_with_ids(static_cast<faiss::idx_t>(labels.size()), flat.data(),
                               labels.data());
    for (const auto &entry : entries) {
      shard->chunk_documents[entry.chunk_id] = entry.metadata.document_id;
    }
  } catch (const faiss::FaissException &e) {
    throw IndexUnavailableError("Failed to add vectors for owner " + std::to_string(owner_id) +
                                ": " + e.what());
  }
}

std::vector<VectorHit> LocalVectorIndex::search(OwnerId owner_id,
                                                const std::vector<float> &query,
                                                size_t k,
                                                const SearchFilters &filters) {
  const std::vector<float> q = normalized(query);
  if (k == 0) {
    return {};
  }

  auto shard = shard_for(owner_id);
  std::shared_lock<std::shared_mutex> lock(shard->mutex);
  if (shard->index->ntotal == 0) {
    return {};
  }

  std::vector<faiss::idx_t> allowed;
  if (!filters.document_ids.empty()) {
    std::unordered_set<DocumentId> wanted(filters.document_ids.begin(),
                                          filters.document_ids.end());
    for (const auto &[chunk_id, document_id] : shard->chunk_documents) {
      if (wanted.count(document_id)) {
        allowed.push_back(chunk_id);
      }
    }
    if (allowed.empty()) {
      return {};
    }
  }

  const size_t candidates =
      allowed.empty() ? static_cast<size_t>(shard->index->ntotal) : allowed.size();
  const size_t actual_k = std::min(k, candidates);
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k, -1);

  try {
    if (allowed.empty()) {
      shard->index->search(1, q.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                           labels.data());
    } else {
      faiss::IDSelectorBatch selector(allowed.size(), allowed.data());
      faiss::SearchParameters params;
      params.sel = &selector;
      shard->index->search(1, q.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                           labels.data(), &params);
    }
  } catch (const faiss::FaissException &e) {
    throw IndexUnavailableError("Search failed for owner " + std::to_string(owner_id) + ": " +
                                e.what());
  }

  std::vector<VectorHit> hits;
  hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    hits.push_back({static_cast<ChunkId>(labels[i]), distances[i]});
  }
  return hits;
}

void LocalVectorIndex::delete_chunk(OwnerId owner_id, ChunkId chunk_id) {
  auto shard = shard_for(owner_id);
  std::unique_lock<std::shared_mutex> lock(shard->mutex);
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM vectors WHERE owner_id = ? AND chunk_id = ?" << owner_id << chunk_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("delete_chunk", e));
  } catch (const DocumentStoreError &e) {
    throw IndexUnavailableError(e.what());
  }
  remove_from_shard(*shard, {chunk_id});
}

void LocalVectorIndex::delete_document(OwnerId owner_id, DocumentId document_id) {
  auto shard = shard_for(owner_id);
  std::unique_lock<std::shared_mutex> lock(shard->mutex);
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM vectors WHERE owner_id = ? AND document_id = ?" << owner_id
          << document_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("delete_document", e));
  } catch (const DocumentStoreError &e) {
    throw IndexUnavailableError(e.what());
  }

  std::vector<ChunkId> ids;
  for (const auto &[chunk_id, doc_id] : shard->chunk_documents) {
    if (doc_id == document_id) {
      ids.push_back(chunk_id);
    }
  }
  remove_from_shard(*shard, ids);
}

void LocalVectorIndex::delete_all(OwnerId owner_id) {
  auto shard = shard_for(owner_id);
  std::unique_lock<std::shared_mutex> lock(shard->mutex);
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM vectors WHERE owner_id = ?" << owner_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexUnavailableError(format_db_error("delete_all", e));
  } catch (const DocumentStoreError &e) {
    throw IndexUnavailableError(e.what());
  }
  shard->index = create_base_index();
  shard->chunk_documents.clear();
}

size_t LocalVectorIndex::size(OwnerId owner_id) {
  auto shard = shard_for(owner_id);
  std::shared_lock<std::shared_mutex> lock(shard->mutex);
  return static_cast<size_t>(shard->index->ntotal);
}

}  // namespace docqa_core
