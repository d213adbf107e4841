#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "docqa_core/generation/fallback_chain.hpp"
#include "docqa_core/generation/openai_backend.hpp"
#include "docqa_core/llm/ollama_client.hpp"

namespace docqa_core {

struct GenerationConfig {
  bool ollama_enabled = true;
  std::string ollama_model = "llama2";
  // Hosted backend is added only when an API key is present
  OpenAiConfig openai;
};

// Chain in preference order: ollama > openai > extractive. The extractive
// backend is always last so the chain can always answer.
std::shared_ptr<FallbackChain> make_fallback_chain(const GenerationConfig &config,
                                                   std::shared_ptr<OllamaClient> ollama_client);

}  // namespace docqa_core
