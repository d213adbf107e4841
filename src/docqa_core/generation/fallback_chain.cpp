#include "docqa_core/generation/fallback_chain.hpp"

#include <iostream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

FallbackChain::FallbackChain(std::vector<std::shared_ptr<GenerationBackend>> backends)
    : backends_(std::move(backends)) {
  if (backends_.empty()) {
    throw InvalidParametersError("FallbackChain requires at least one backend");
  }
  for (const auto &backend : backends_) {
    if (!backend) {
      throw InvalidParametersError("FallbackChain backends must not be null");
    }
  }
}

std::string FallbackChain::describe() const {
  std::string out;
  for (const auto &backend : backends_) {
    if (!out.empty()) {
      out += " > ";
    }
    out += backend->name();
  }
  return out;
}

GenerationResult FallbackChain::generate(const ContextBundle &context,
                                         const std::optional<GenerationOptions> &options,
                                         const FallbackObserver &observer,
                                         const CancelPredicate &is_cancelled) {
  GenerationResult result;
  std::string last_error;

  for (size_t i = 0; i < backends_.size(); ++i) {
    if (is_cancelled && is_cancelled()) {
      result.stopped = true;
      return result;
    }
    auto &backend = backends_[i];
    try {
      result.text = backend->generate(context, options.value_or(backend->default_options()));
      result.backend = backend->name();
      return result;
    } catch (const GenerationBackendError &e) {
      last_error = e.what();
      std::cerr << "[FallbackChain] " << backend->name() << " failed: " << e.what() << std::endl;
      if (i + 1 < backends_.size()) {
        FallbackNotice notice{backend->name(), backends_[i + 1]->name(), e.what()};
        result.fallbacks.push_back(notice);
        if (observer) {
          observer(notice);
        }
      }
    }
  }
  throw GenerationBackendError("fallback_chain", "all backends failed, last error: " + last_error);
}

GenerationResult FallbackChain::generate_stream(const ContextBundle &context,
                                                const FragmentCallback &on_fragment,
                                                const std::optional<GenerationOptions> &options,
                                                const FallbackObserver &observer,
                                                const CancelPredicate &is_cancelled) {
  GenerationResult result;
  std::string last_error;

  for (size_t i = 0; i < backends_.size(); ++i) {
    if (is_cancelled && is_cancelled()) {
      result.stopped = true;
      return result;
    }
    auto &backend = backends_[i];
    bool delivered = false;

    auto forward = [&](const std::string &fragment) {
      if (is_cancelled && is_cancelled()) {
        result.stopped = true;
        return false;
      }
      delivered = true;
      result.text += fragment;
      if (!on_fragment(fragment)) {
        result.stopped = true;
        return false;
      }
      return true;
    };

    try {
      backend->generate_stream(context, options.value_or(backend->default_options()), forward);
      result.backend = backend->name();
      return result;
    } catch (const GenerationBackendError &e) {
      std::cerr << "[FallbackChain] " << backend->name() << " failed while streaming: " << e.what()
                << std::endl;
      if (result.stopped) {
        result.backend = backend->name();
        return result;
      }
      if (delivered) {
        // Part of this answer is already out; starting over would repeat it
        throw;
      }
      last_error = e.what();
      if (i + 1 < backends_.size()) {
        FallbackNotice notice{backend->name(), backends_[i + 1]->name(), e.what()};
        result.fallbacks.push_back(notice);
        if (observer) {
          observer(notice);
        }
      }
    }
  }
  throw GenerationBackendError("fallback_chain", "all backends failed, last error: " + last_error);
}

}  // namespace docqa_core
