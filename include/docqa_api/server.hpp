#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace docqa_api {

// Owns the Crow app and the thread it runs on
class Server {
 public:
  // bind_address is "host:port", as in Config::api_base_url
  explicit Server(const std::string &bind_address);

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  const std::string &host() const {
    return host_;
  }
  uint16_t port() const {
    return port_;
  }

  // Throws if the listener exits during start-up (port taken, bad host)
  void start(unsigned int concurrency);

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  uint16_t port_ = 0;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace docqa_api
