#pragma once

#include "docqa_core/embedding/embedding_provider.hpp"

namespace docqa_core {

/**
 * @brief Deterministic offline embedder.
 *
 * Hashes lowercased word unigrams and bigrams into signed buckets and
 * L2-normalizes the result. Texts sharing words land close together, which is
 * enough for tests and for running without a model server.
 */
class HashingEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(size_t dimension = 384);

  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string name() const override {
    return "hashing";
  }

 private:
  void add_feature(std::vector<float> &vec, const std::string &feature, float weight) const;

  size_t dimension_;
};

}  // namespace docqa_core
