#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

/**
 * @brief Splits document text into overlapping windows.
 *
 * Sizes are counted in Unicode code points. A window that would end mid-text is
 * pulled back to just after the last '.' or '\n' within the lookback range, when
 * one exists. Each piece is whitespace-trimmed and empty pieces are dropped.
 * The next window starts overlap code points before the previous one ended.
 */
class TextChunker {
 public:
  // Throws InvalidParametersError unless 0 <= overlap < target_size
  explicit TextChunker(ChunkingParams params = {});

  std::vector<Chunk> chunk(const std::string &text) const;

  const ChunkingParams &params() const {
    return params_;
  }

  static void validate(const ChunkingParams &params);

 private:
  ChunkingParams params_;
};

}  // namespace docqa_core
