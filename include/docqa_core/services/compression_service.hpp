#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

// zstd codec for chunk text at rest
class CompressionService {
 public:
  /**
   * @brief Compresses a block of data using Zstandard.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return Compressed frame; empty for empty input.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame.
   * @throws DocumentStoreError if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace docqa_core
