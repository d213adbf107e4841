#pragma once

#include <memory>
#include <string>

#include "docqa_core/generation/generation_backend.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

/**
 * Local model served by Ollama. The request timeout is the one the client was
 * built with.
 */
class OllamaBackend : public GenerationBackend {
 public:
  OllamaBackend(std::shared_ptr<OllamaClient> client, std::string model);

  std::string name() const override {
    return "ollama";
  }

  GenerationOptions default_options() const override;

  std::string generate(const ContextBundle &context, const GenerationOptions &options) override;

  void generate_stream(const ContextBundle &context,
                       const GenerationOptions &options,
                       const FragmentCallback &on_fragment) override;

  static nlohmann::json to_request_options(const GenerationOptions &options);

 private:
  std::shared_ptr<OllamaClient> client_;
  std::string model_;
};

}  // namespace docqa_core
