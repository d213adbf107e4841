#include "docqa_core/llm/ollama_client.hpp"

#include "ollama.hpp"

namespace docqa_core {

namespace {

ollama::options to_ollama_options(const nlohmann::json &options) {
  ollama::options out;
  if (options.is_object()) {
    for (auto it = options.begin(); it != options.end(); ++it) {
      out[it.key()] = it.value();
    }
  }
  return out;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url, std::chrono::seconds timeout)
    : ollama_url_(ollama_url), timeout_(timeout) {}

std::vector<float> OllamaClient::get_embedding(const std::string &model, const std::string &text) {
  try {
    ollama::Ollama server(ollama_url_);
    server.setReadTimeout(static_cast<int>(timeout_.count()));
    server.setWriteTimeout(static_cast<int>(timeout_.count()));
    ollama::response response = server.generate_embeddings(model, text);

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embedding field");
    }

    // Either a list of vectors (one per input) or a single flat vector
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw OllamaError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &model,
                                   const std::string &prompt,
                                   const nlohmann::json &options) {
  try {
    ollama::Ollama server(ollama_url_);
    server.setReadTimeout(static_cast<int>(timeout_.count()));
    server.setWriteTimeout(static_cast<int>(timeout_.count()));
    ollama::response response = server.generate(model, prompt, to_ollama_options(options));
    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      throw OllamaError("Generation failed: " + json_response["error"].dump());
    }
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Generation failed: " + std::string(e.what()));
  }
}

void OllamaClient::generate_stream(const std::string &model,
                                   const std::string &prompt,
                                   const nlohmann::json &options,
                                   const OllamaTokenCallback &on_token) {
  std::string stream_error;
  std::function<bool(const ollama::response &)> on_response =
      [&](const ollama::response &response) {
        auto json_response = response.as_json();
        if (json_response.contains("error")) {
          stream_error = json_response["error"].dump();
          return false;
        }
        const std::string token = response.as_simple_string();
        if (token.empty()) {
          return true;
        }
        return on_token(token);
      };

  try {
    ollama::Ollama server(ollama_url_);
    server.setReadTimeout(static_cast<int>(timeout_.count()));
    server.setWriteTimeout(static_cast<int>(timeout_.count()));
    server.generate(model, prompt, on_response, to_ollama_options(options));
  } catch (const ollama::exception &e) {
    throw OllamaError("Streaming generation failed: " + std::string(e.what()));
  }
  if (!stream_error.empty()) {
    throw OllamaError("Streaming generation failed: " + stream_error);
  }
}

bool OllamaClient::is_server_available() {
  try {
    ollama::Ollama server(ollama_url_);
    return server.is_running();
  } catch (const ollama::exception &e) {
    return false;
  }
}

}  // namespace docqa_core
