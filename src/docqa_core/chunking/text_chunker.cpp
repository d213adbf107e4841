#include "docqa_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

#include "docqa_core/errors.hpp"
#include "docqa_core/util/hashing.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

namespace {

bool is_break(char32_t cp) {
  return cp == U'.' || cp == U'\n';
}

bool is_space(char32_t cp) {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v';
}

std::string encode(const std::u32string &cps, size_t begin, size_t end) {
  while (begin < end && is_space(cps[begin])) {
    ++begin;
  }
  while (end > begin && is_space(cps[end - 1])) {
    --end;
  }
  std::string out;
  utf8::utf32to8(cps.begin() + begin, cps.begin() + end, std::back_inserter(out));
  return out;
}

}  // namespace

TextChunker::TextChunker(ChunkingParams params) : params_(params) {
  validate(params_);
}

void TextChunker::validate(const ChunkingParams &params) {
  if (params.target_size == 0) {
    throw InvalidParametersError("chunk target size must be positive");
  }
  if (params.overlap >= params.target_size) {
    throw InvalidParametersError("chunk overlap (" + std::to_string(params.overlap) +
                                 ") must be smaller than target size (" +
                                 std::to_string(params.target_size) + ")");
  }
}

std::vector<Chunk> TextChunker::chunk(const std::string &text) const {
  std::vector<Chunk> out;
  const std::string valid = text::sanitize_utf8(text);
  std::u32string cps;
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(cps));

  const size_t n = cps.size();
  size_t start = 0;
  int index = 0;
  while (start < n) {
    const size_t hard_end = std::min(start + params_.target_size, n);
    size_t end = hard_end;

    if (hard_end < n) {
      // The floor keeps end - overlap > start, so every window advances
      const size_t progress_floor = start + params_.overlap + 1;
      const size_t lookback_floor =
          hard_end > params_.lookback ? hard_end - params_.lookback : 0;
      const size_t floor = std::max(progress_floor, lookback_floor);
      for (size_t p = hard_end; p > floor; --p) {
        if (is_break(cps[p - 1])) {
          end = p;
          break;
        }
      }
    }

    std::string piece = encode(cps, start, end);
    if (!piece.empty()) {
      Chunk chunk;
      chunk.chunk_index = index++;
      chunk.content_hash = sha256_hex(piece);
      chunk.content = std::move(piece);
      chunk.target_size = params_.target_size;
      chunk.overlap = params_.overlap;
      chunk.start_offset = start;
      chunk.end_offset = end;
      out.push_back(std::move(chunk));
    }

    if (end >= n) {
      break;
    }
    start = end - params_.overlap;
  }
  return out;
}

}  // namespace docqa_core
