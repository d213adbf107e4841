#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/generation/generation_backend.hpp"

namespace docqa_core {

struct FallbackNotice {
  std::string failed_backend;
  std::string next_backend;
  std::string reason;

  // Text of the status event shown to stream consumers
  std::string message() const {
    return "fallback: " + failed_backend + " unavailable, using " + next_backend;
  }
};

struct GenerationResult {
  std::string text;
  std::string backend;
  std::vector<FallbackNotice> fallbacks;
  // True when the consumer asked to stop before the backend finished
  bool stopped = false;
};

using FallbackObserver = std::function<void(const FallbackNotice &)>;
using CancelPredicate = std::function<bool()>;

/**
 * Ordered list of backends. A GenerationBackendError moves on to the next one;
 * any completion, empty included, is final. When streaming, a backend that
 * already delivered a fragment is not replaced: its failure propagates.
 */
class FallbackChain {
 public:
  explicit FallbackChain(std::vector<std::shared_ptr<GenerationBackend>> backends);

  GenerationResult generate(const ContextBundle &context,
                            const std::optional<GenerationOptions> &options = std::nullopt,
                            const FallbackObserver &observer = nullptr,
                            const CancelPredicate &is_cancelled = nullptr);

  GenerationResult generate_stream(const ContextBundle &context,
                                   const FragmentCallback &on_fragment,
                                   const std::optional<GenerationOptions> &options = std::nullopt,
                                   const FallbackObserver &observer = nullptr,
                                   const CancelPredicate &is_cancelled = nullptr);

  // Backend names in preference order, e.g. "ollama > openai > extractive"
  std::string describe() const;

  const std::vector<std::shared_ptr<GenerationBackend>> &backends() const {
    return backends_;
  }

 private:
  std::vector<std::shared_ptr<GenerationBackend>> backends_;
};

}  // namespace docqa_core
