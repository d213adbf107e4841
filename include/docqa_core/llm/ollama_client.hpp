#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Receives each streamed token; return false to stop the stream
using OllamaTokenCallback = std::function<bool(const std::string &token)>;

/**
 * Thin wrapper over ollama-hpp. Every call opens its own connection so a single
 * client can serve concurrent sessions.
 */
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url, std::chrono::seconds timeout);
  virtual ~OllamaClient() = default;

  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &model, const std::string &text);

  virtual std::string generate(const std::string &model,
                               const std::string &prompt,
                               const nlohmann::json &options);

  virtual void generate_stream(const std::string &model,
                               const std::string &prompt,
                               const nlohmann::json &options,
                               const OllamaTokenCallback &on_token);

  virtual bool is_server_available();

  const std::string &url() const {
    return ollama_url_;
  }

 private:
  std::string ollama_url_;
  std::chrono::seconds timeout_;
};

}  // namespace docqa_core
