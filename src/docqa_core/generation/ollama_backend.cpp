#include "docqa_core/generation/ollama_backend.hpp"

#include "docqa_core/errors.hpp"

namespace docqa_core {

OllamaBackend::OllamaBackend(std::shared_ptr<OllamaClient> client, std::string model)
    : client_(std::move(client)), model_(std::move(model)) {
  if (!client_) {
    throw InvalidParametersError("OllamaBackend requires a client");
  }
}

GenerationOptions OllamaBackend::default_options() const {
  return GenerationOptions{};
}

nlohmann::json OllamaBackend::to_request_options(const GenerationOptions &options) {
  return {{"temperature", options.temperature},
          {"top_p", options.top_p},
          {"num_predict", options.max_output_tokens},
          {"stop", options.stop}};
}

std::string OllamaBackend::generate(const ContextBundle &context,
                                    const GenerationOptions &options) {
  if (context.empty()) {
    return kNoContextAnswer;
  }
  try {
    return client_->generate(model_, build_prompt(context), to_request_options(options));
  } catch (const OllamaError &e) {
    throw GenerationBackendError(name(), e.what());
  }
}

void OllamaBackend::generate_stream(const ContextBundle &context,
                                    const GenerationOptions &options,
                                    const FragmentCallback &on_fragment) {
  if (context.empty()) {
    on_fragment(kNoContextAnswer);
    return;
  }
  try {
    client_->generate_stream(model_, build_prompt(context), to_request_options(options),
                             on_fragment);
  } catch (const OllamaError &e) {
    throw GenerationBackendError(name(), e.what());
  }
}

}  // namespace docqa_core
