#include "docqa_core/services/compression_service.hpp"

#include <zstd.h>

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> compressed_buffer(ZSTD_compressBound(data.size()));

  const size_t compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw DocumentStoreError("ZSTD compression failed: " +
                             std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long decompressed_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (decompressed_size == ZSTD_CONTENTSIZE_ERROR ||
      decompressed_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw DocumentStoreError("Stored chunk is not a zstd frame with a known size");
  }

  std::string decompressed_buffer(decompressed_size, '\0');
  const size_t actual_size = ZSTD_decompress(decompressed_buffer.data(), decompressed_buffer.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw DocumentStoreError("ZSTD decompression failed: " +
                             std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != decompressed_size) {
    throw DocumentStoreError("ZSTD decompression produced " + std::to_string(actual_size) +
                             " bytes, expected " + std::to_string(decompressed_size));
  }
  return decompressed_buffer;
}

}  // namespace docqa_core
