#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct ContextEntry {
  ChunkId chunk_id = 0;
  DocumentId document_id = 0;
  int chunk_index = 0;
  std::string text;
  float score = 0.0f;
};

// Ordered most relevant first. Total length is measured in code points.
struct ContextBundle {
  std::string question;
  std::vector<ContextEntry> entries;
  size_t total_length = 0;

  bool empty() const {
    return entries.empty();
  }

  std::vector<std::string> texts() const;
  std::vector<ChunkId> chunk_ids() const;
};

}  // namespace docqa_core
