#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

// Transport-level failure: connection refused, timeout, DNS and the like
class HttpError : public std::exception {
 public:
  explicit HttpError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct HttpResponse {
  long status = 0;
  std::string body;
  // True when the body callback asked to stop the transfer
  bool aborted = false;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

// Returning false from the callback aborts the transfer
using HttpChunkCallback = std::function<bool(std::string_view)>;

/**
 * Minimal JSON-over-HTTP client on libcurl. Each call uses its own easy handle,
 * so one instance can be shared between threads.
 */
class HttpClient {
 public:
  HttpClient(std::string base_url,
             std::chrono::milliseconds timeout,
             std::vector<std::string> default_headers = {});

  HttpResponse get(const std::string &path) const;
  HttpResponse del(const std::string &path) const;
  HttpResponse post(const std::string &path,
                    const std::string &body,
                    const std::string &content_type = "application/json") const;
  HttpResponse put(const std::string &path, const std::string &body) const;

  // POST whose response body is handed to on_chunk as it arrives
  HttpResponse post_streaming(const std::string &path,
                              const std::string &body,
                              const HttpChunkCallback &on_chunk) const;

  const std::string &base_url() const {
    return base_url_;
  }

 private:
  HttpResponse perform(const std::string &method,
                       const std::string &path,
                       const std::string *body,
                       const std::string &content_type,
                       const HttpChunkCallback *on_chunk) const;

  std::string base_url_;
  std::chrono::milliseconds timeout_;
  std::vector<std::string> default_headers_;
};

}  // namespace docqa_core
