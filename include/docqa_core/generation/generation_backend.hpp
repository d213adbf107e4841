#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "docqa_core/types/context_bundle.hpp"

namespace docqa_core {

struct GenerationOptions {
  float temperature = 0.3f;
  float top_p = 0.9f;
  int max_output_tokens = 500;
  std::vector<std::string> stop = {"Question:", "Context:"};
  std::chrono::seconds timeout{60};
};

// Receives one fragment; returning false asks the backend to stop
using FragmentCallback = std::function<bool(const std::string &fragment)>;

inline constexpr const char *kNoContextAnswer =
    "I don't have enough information to answer this question. Please upload relevant "
    "documents first.";

// Prompt shared by the model-backed variants; uses at most max_chunks entries
std::string build_prompt(const ContextBundle &context, size_t max_chunks = 5);

/**
 * A way of turning (question, context) into answer text. Failures of the
 * underlying service surface as GenerationBackendError. The streamed fragments
 * concatenate to what generate() would return for the same completion.
 */
class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  virtual std::string name() const = 0;
  virtual GenerationOptions default_options() const = 0;

  virtual std::string generate(const ContextBundle &context, const GenerationOptions &options) = 0;

  virtual void generate_stream(const ContextBundle &context,
                               const GenerationOptions &options,
                               const FragmentCallback &on_fragment) = 0;
};

}  // namespace docqa_core
