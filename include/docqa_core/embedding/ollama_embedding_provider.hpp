#pragma once

#include <memory>

#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(std::shared_ptr<OllamaClient> client,
                          std::string model,
                          size_t dimension);

  // Throws EmbeddingUnavailableError on transport failure or a vector of the wrong size
  std::vector<float> embed(const std::string &text) override;

  size_t dimension() const override {
    return dimension_;
  }

  std::string name() const override {
    return "ollama:" + model_;
  }

 private:
  std::shared_ptr<OllamaClient> client_;
  std::string model_;
  size_t dimension_;
};

}  // namespace docqa_core
