#include "docqa_api/server.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace docqa_api {

Server::Server(const std::string &bind_address) {
  const auto colon = bind_address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == bind_address.size()) {
    throw std::runtime_error("Bind address must be host:port, got '" + bind_address + "'");
  }
  host_ = bind_address.substr(0, colon);
  int port = 0;
  try {
    size_t parsed = 0;
    port = std::stoi(bind_address.substr(colon + 1), &parsed);
    if (parsed != bind_address.size() - colon - 1) {
      port = -1;
    }
  } catch (const std::exception &) {
    port = -1;
  }
  if (port <= 0 || port > 65535) {
    throw std::runtime_error("Invalid port in bind address '" + bind_address + "'");
  }
  port_ = static_cast<uint16_t>(port);
}

void Server::start(unsigned int concurrency) {
  if (running_) {
    return;
  }
  run_future_ = std::async(std::launch::async, [this, concurrency] {
    app_.port(port_).bindaddr(host_).concurrency(concurrency).run();
  });

  // run() returning early means the listener never came up
  if (run_future_.wait_for(std::chrono::milliseconds(250)) == std::future_status::ready) {
    run_future_.get();
    throw std::runtime_error("Server failed to listen on " + host_ + ":" + std::to_string(port_));
  }
  running_ = true;
  std::cout << "[Server] listening on " << host_ << ":" << port_ << " with " << concurrency
            << " threads" << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
}

}  // namespace docqa_api
