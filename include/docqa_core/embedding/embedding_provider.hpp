#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace docqa_core {

/**
 * Maps text to a fixed-dimension vector. Implementations throw
 * EmbeddingUnavailableError when the backing model cannot be reached.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;

  // Defaults to one embed() call per text
  virtual std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts);

  virtual size_t dimension() const = 0;
  virtual std::string name() const = 0;
};

// Retries a failed embedding call once after a fixed backoff
class RetryingEmbeddingProvider : public EmbeddingProvider {
 public:
  RetryingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                            std::chrono::milliseconds backoff);

  std::vector<float> embed(const std::string &text) override;
  std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts) override;

  size_t dimension() const override {
    return inner_->dimension();
  }

  std::string name() const override {
    return inner_->name();
  }

 private:
  std::shared_ptr<EmbeddingProvider> inner_;
  std::chrono::milliseconds backoff_;
};

}  // namespace docqa_core
