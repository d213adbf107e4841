#include "docqa_core/embedding/hashing_embedding_provider.hpp"

#include <cmath>
#include <cstdint>

#include "docqa_core/errors.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

namespace {

// FNV-1a, stable across platforms unlike std::hash
std::uint64_t fnv1a(const std::string &s) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidParametersError("embedding dimension must be positive");
  }
}

void HashingEmbeddingProvider::add_feature(std::vector<float> &vec,
                                           const std::string &feature,
                                           float weight) const {
  const std::uint64_t h = fnv1a(feature);
  const size_t bucket = static_cast<size_t>(h % dimension_);
  const float sign = (h >> 63) ? -1.0f : 1.0f;
  vec[bucket] += sign * weight;
}

std::vector<float> HashingEmbeddingProvider::embed(const std::string &text) {
  std::vector<float> vec(dimension_, 0.0f);
  const auto tokens = text::words(text);
  for (size_t i = 0; i < tokens.size(); ++i) {
    add_feature(vec, tokens[i], 1.0f);
    if (i + 1 < tokens.size()) {
      add_feature(vec, tokens[i] + " " + tokens[i + 1], 0.5f);
    }
  }

  double norm = 0.0;
  for (float v : vec) {
    norm += static_cast<double>(v) * v;
  }
  if (norm > 0.0) {
    const float inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float &v : vec) {
      v *= inv;
    }
  }
  return vec;
}

}  // namespace docqa_core
