#include "docqa_core/generation/openai_backend.hpp"

#include "docqa_core/errors.hpp"
#include "docqa_core/util/http_client.hpp"
#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

namespace {

constexpr const char *kSystemMessage =
    "You are a helpful assistant that answers questions based on provided context. Be concise "
    "and accurate.";

HttpClient make_client(const OpenAiConfig &config, const GenerationOptions &options) {
  return HttpClient(config.base_url,
                    std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout),
                    {"Authorization: Bearer " + config.api_key});
}

}  // namespace

bool SseLineParser::feed(std::string_view bytes,
                         const std::function<bool(const std::string &)> &on_data) {
  if (done_) {
    return false;
  }
  buffer_.append(bytes.data(), bytes.size());

  size_t newline;
  while ((newline = buffer_.find('\n')) != std::string::npos) {
    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.rfind("data:", 0) != 0) {
      continue;  // blank separators, comments, event names
    }
    std::string payload = text::trim(line.substr(5));
    if (payload == "[DONE]") {
      done_ = true;
      return false;
    }
    if (payload.empty()) {
      continue;
    }
    if (!on_data(payload)) {
      return false;
    }
  }
  return true;
}

OpenAiBackend::OpenAiBackend(OpenAiConfig config) : config_(std::move(config)) {
  if (config_.api_key.empty()) {
    throw InvalidParametersError("OpenAiBackend requires an API key");
  }
}

GenerationOptions OpenAiBackend::default_options() const {
  GenerationOptions options;
  options.timeout = config_.timeout;
  return options;
}

nlohmann::json OpenAiBackend::build_request_body(const ContextBundle &context,
                                                 const GenerationOptions &options,
                                                 bool stream) const {
  nlohmann::json body = {
      {"model", config_.model},
      {"messages",
       nlohmann::json::array({{{"role", "system"}, {"content", kSystemMessage}},
                              {{"role", "user"}, {"content", build_prompt(context)}}})},
      {"temperature", options.temperature},
      {"top_p", options.top_p},
      {"max_tokens", options.max_output_tokens},
      {"stream", stream}};
  if (!options.stop.empty()) {
    body["stop"] = options.stop;
  }
  return body;
}

std::string OpenAiBackend::extract_delta(const nlohmann::json &chunk) {
  if (!chunk.contains("choices") || !chunk["choices"].is_array() || chunk["choices"].empty()) {
    return "";
  }
  const auto &choice = chunk["choices"][0];
  if (!choice.contains("delta") || !choice["delta"].contains("content") ||
      !choice["delta"]["content"].is_string()) {
    return "";
  }
  return choice["delta"]["content"].get<std::string>();
}

std::string OpenAiBackend::generate(const ContextBundle &context,
                                    const GenerationOptions &options) {
  if (context.empty()) {
    return kNoContextAnswer;
  }

  HttpResponse response;
  try {
    response = make_client(config_, options)
                   .post("/chat/completions", build_request_body(context, options, false).dump());
  } catch (const HttpError &e) {
    throw GenerationBackendError(name(), e.what());
  }
  if (!response.ok()) {
    throw GenerationBackendError(name(), "HTTP " + std::to_string(response.status) + ": " +
                                             text::truncate_code_points(response.body, 200));
  }

  try {
    auto json = nlohmann::json::parse(response.body);
    const auto &content = json.at("choices").at(0).at("message").at("content");
    return content.is_string() ? content.get<std::string>() : "";
  } catch (const nlohmann::json::exception &e) {
    throw GenerationBackendError(name(), "malformed response: " + std::string(e.what()));
  }
}

void OpenAiBackend::generate_stream(const ContextBundle &context,
                                    const GenerationOptions &options,
                                    const FragmentCallback &on_fragment) {
  if (context.empty()) {
    on_fragment(kNoContextAnswer);
    return;
  }

  SseLineParser parser;
  std::string parse_error;
  std::string error_body;

  auto on_data = [&](const std::string &payload) {
    nlohmann::json chunk = nlohmann::json::parse(payload, nullptr, false);
    if (chunk.is_discarded()) {
      parse_error = "malformed stream chunk";
      return false;
    }
    if (chunk.contains("error")) {
      parse_error = chunk["error"].dump();
      return false;
    }
    const std::string fragment = extract_delta(chunk);
    if (fragment.empty()) {
      return true;
    }
    return on_fragment(fragment);
  };

  HttpResponse response;
  try {
    response = make_client(config_, options)
                   .post_streaming("/chat/completions",
                                   build_request_body(context, options, true).dump(),
                                   [&](std::string_view bytes) {
                                     // Error bodies are plain JSON, not events
                                     if (error_body.size() < 4096 &&
                                         bytes.find("data:") == std::string_view::npos) {
                                       error_body.append(bytes.data(), bytes.size());
                                     }
                                     return parser.feed(bytes, on_data) || parser.done();
                                   });
  } catch (const HttpError &e) {
    throw GenerationBackendError(name(), e.what());
  }

  if (!parse_error.empty()) {
    throw GenerationBackendError(name(), parse_error);
  }
  if (!response.aborted && !response.ok()) {
    throw GenerationBackendError(name(), "HTTP " + std::to_string(response.status) + ": " +
                                             text::truncate_code_points(error_body, 200));
  }
}

}  // namespace docqa_core
