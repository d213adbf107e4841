#include "docqa_core/embedding/ollama_embedding_provider.hpp"

#include "docqa_core/errors.hpp"

namespace docqa_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                                                 std::string model,
                                                 size_t dimension)
    : client_(std::move(client)), model_(std::move(model)), dimension_(dimension) {
  if (!client_) {
    throw InvalidParametersError("OllamaEmbeddingProvider requires a client");
  }
  if (dimension_ == 0) {
    throw InvalidParametersError("embedding dimension must be positive");
  }
}

std::vector<float> OllamaEmbeddingProvider::embed(const std::string &text) {
  std::vector<float> vec;
  try {
    vec = client_->get_embedding(model_, text);
  } catch (const OllamaError &e) {
    throw EmbeddingUnavailableError(e.what());
  }
  if (vec.size() != dimension_) {
    throw EmbeddingUnavailableError("Embedding model " + model_ + " returned " +
                                    std::to_string(vec.size()) + " dimensions, expected " +
                                    std::to_string(dimension_));
  }
  return vec;
}

}  // namespace docqa_core
