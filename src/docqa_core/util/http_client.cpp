#include "docqa_core/util/http_client.hpp"

#include <curl/curl.h>

#include <mutex>

namespace docqa_core {

namespace {

struct TransferState {
  std::string *buffer = nullptr;
  const HttpChunkCallback *on_chunk = nullptr;
  bool aborted = false;
};

size_t write_callback(char *contents, size_t size, size_t nmemb, void *userp) {
  auto *state = static_cast<TransferState *>(userp);
  const size_t total = size * nmemb;
  if (state->on_chunk && *state->on_chunk) {
    if (!(*state->on_chunk)(std::string_view(contents, total))) {
      state->aborted = true;
      // Anything other than total makes curl stop with CURLE_WRITE_ERROR
      return 0;
    }
    return total;
  }
  state->buffer->append(contents, total);
  return total;
}

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

HttpClient::HttpClient(std::string base_url,
                       std::chrono::milliseconds timeout,
                       std::vector<std::string> default_headers)
    : base_url_(std::move(base_url)),
      timeout_(timeout),
      default_headers_(std::move(default_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
  ensure_curl_initialized();
}

HttpResponse HttpClient::get(const std::string &path) const {
  return perform("GET", path, nullptr, "", nullptr);
}

HttpResponse HttpClient::del(const std::string &path) const {
  return perform("DELETE", path, nullptr, "", nullptr);
}

HttpResponse HttpClient::post(const std::string &path,
                              const std::string &body,
                              const std::string &content_type) const {
  return perform("POST", path, &body, content_type, nullptr);
}

HttpResponse HttpClient::put(const std::string &path, const std::string &body) const {
  return perform("PUT", path, &body, "application/json", nullptr);
}

HttpResponse HttpClient::post_streaming(const std::string &path,
                                        const std::string &body,
                                        const HttpChunkCallback &on_chunk) const {
  return perform("POST", path, &body, "application/json", &on_chunk);
}

HttpResponse HttpClient::perform(const std::string &method,
                                 const std::string &path,
                                 const std::string *body,
                                 const std::string &content_type,
                                 const HttpChunkCallback *on_chunk) const {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw HttpError("Failed to initialize CURL");
  }

  HttpResponse response;
  TransferState state;
  state.buffer = &response.body;
  state.on_chunk = on_chunk;

  struct curl_slist *headers = nullptr;
  if (body) {
    headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
  }
  for (const auto &header : default_headers_) {
    headers = curl_slist_append(headers, header.c_str());
  }

  const std::string url = base_url_ + path;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }
  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
  } else if (method != "GET") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  if (body) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (state.aborted) {
    response.aborted = true;
    return response;
  }
  if (res != CURLE_OK) {
    throw HttpError(method + " " + url + " failed: " + curl_easy_strerror(res));
  }
  return response;
}

}  // namespace docqa_core
