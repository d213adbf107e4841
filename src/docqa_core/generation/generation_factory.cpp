#include "docqa_core/generation/generation_factory.hpp"

#include <iostream>

#include "docqa_core/generation/extractive_backend.hpp"
#include "docqa_core/generation/ollama_backend.hpp"

namespace docqa_core {

std::shared_ptr<FallbackChain> make_fallback_chain(const GenerationConfig &config,
                                                   std::shared_ptr<OllamaClient> ollama_client) {
  std::vector<std::shared_ptr<GenerationBackend>> backends;

  if (config.ollama_enabled && ollama_client) {
    backends.push_back(std::make_shared<OllamaBackend>(ollama_client, config.ollama_model));
  }
  if (!config.openai.api_key.empty()) {
    backends.push_back(std::make_shared<OpenAiBackend>(config.openai));
  }
  backends.push_back(std::make_shared<ExtractiveBackend>());

  auto chain = std::make_shared<FallbackChain>(std::move(backends));
  std::cout << "Generation chain: " << chain->describe() << std::endl;
  return chain;
}

}  // namespace docqa_core
