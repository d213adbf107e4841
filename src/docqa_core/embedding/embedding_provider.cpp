#include "docqa_core/embedding/embedding_provider.hpp"

#include "docqa_core/errors.hpp"
#include "docqa_core/util/retry.hpp"

namespace docqa_core {

std::vector<std::vector<float>> EmbeddingProvider::embed_many(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(embed(text));
  }
  return out;
}

RetryingEmbeddingProvider::RetryingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                                                     std::chrono::milliseconds backoff)
    : inner_(std::move(inner)), backoff_(backoff) {
  if (!inner_) {
    throw InvalidParametersError("RetryingEmbeddingProvider requires an inner provider");
  }
}

std::vector<float> RetryingEmbeddingProvider::embed(const std::string &text) {
  return retry_once<EmbeddingUnavailableError>("embedding via " + inner_->name(), backoff_,
                                               [&] { return inner_->embed(text); });
}

std::vector<std::vector<float>> RetryingEmbeddingProvider::embed_many(
    const std::vector<std::string> &texts) {
  return retry_once<EmbeddingUnavailableError>("batch embedding via " + inner_->name(), backoff_,
                                               [&] { return inner_->embed_many(texts); });
}

}  // namespace docqa_core
