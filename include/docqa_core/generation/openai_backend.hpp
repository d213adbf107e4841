#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "docqa_core/generation/generation_backend.hpp"

namespace docqa_core {

// Splits a text/event-stream body into "data:" payloads across arbitrary read boundaries
class SseLineParser {
 public:
  // Calls on_data once per complete data line. Returns false as soon as
  // on_data does, or after the [DONE] sentinel.
  bool feed(std::string_view bytes, const std::function<bool(const std::string &)> &on_data);

  bool done() const {
    return done_;
  }

 private:
  std::string buffer_;
  bool done_ = false;
};

struct OpenAiConfig {
  std::string api_key;
  std::string base_url = "https://api.openai.com/v1";
  std::string model = "gpt-3.5-turbo";
  std::chrono::seconds timeout{60};
};

/**
 * Hosted model behind an OpenAI-compatible chat completions endpoint.
 */
class OpenAiBackend : public GenerationBackend {
 public:
  explicit OpenAiBackend(OpenAiConfig config);

  std::string name() const override {
    return "openai";
  }

  GenerationOptions default_options() const override;

  std::string generate(const ContextBundle &context, const GenerationOptions &options) override;

  void generate_stream(const ContextBundle &context,
                       const GenerationOptions &options,
                       const FragmentCallback &on_fragment) override;

  nlohmann::json build_request_body(const ContextBundle &context,
                                    const GenerationOptions &options,
                                    bool stream) const;

  // Content of one streamed completion chunk; empty when the delta carries none
  static std::string extract_delta(const nlohmann::json &chunk);

 private:
  OpenAiConfig config_;
};

}  // namespace docqa_core
