#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct VectorMetadata {
  DocumentId document_id = 0;
  int chunk_index = 0;
  // Chunk text; only stores with lexical search use it
  std::string content;
};

struct VectorEntry {
  ChunkId chunk_id = 0;
  std::vector<float> vector;
  VectorMetadata metadata;
};

struct SearchFilters {
  // Restrict hits to these documents; empty means all of the owner's documents
  std::vector<DocumentId> document_ids;
  // Optional lexical hint for stores with hybrid search
  std::string text_hint;
};

struct VectorHit {
  ChunkId chunk_id = 0;
  float score = 0.0f;
};

/**
 * Owner-partitioned similarity index over chunk vectors. Every operation is
 * scoped to one owner and never observes or touches another owner's entries.
 * Failures of the backing store surface as IndexUnavailableError; a vector of
 * the wrong dimension as InvalidParametersError.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Upserts by chunk id. A chunk id already held by another owner throws
  // InvalidParametersError and leaves the index unchanged.
  virtual void add(OwnerId owner_id,
                   ChunkId chunk_id,
                   const std::vector<float> &vector,
                   const VectorMetadata &metadata) = 0;

  virtual void add_batch(OwnerId owner_id, const std::vector<VectorEntry> &entries);

  // At most k hits, best first. Scores are comparable only within one variant.
  virtual std::vector<VectorHit> search(OwnerId owner_id,
                                        const std::vector<float> &query,
                                        size_t k,
                                        const SearchFilters &filters) = 0;

  // Deletes are idempotent
  virtual void delete_chunk(OwnerId owner_id, ChunkId chunk_id) = 0;
  virtual void delete_document(OwnerId owner_id, DocumentId document_id) = 0;
  virtual void delete_all(OwnerId owner_id) = 0;

  virtual size_t dimension() const = 0;
  virtual std::string name() const = 0;
};

}  // namespace docqa_core
