#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace docqa_core {

// Runs fn; if it throws Error, waits backoff and runs it exactly once more.
// The second failure propagates unchanged.
template <typename Error, typename Fn>
auto retry_once(const std::string &operation, std::chrono::milliseconds backoff, Fn &&fn)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error &e) {
    std::cerr << "Warning: " << operation << " failed (" << e.what() << "), retrying in "
              << backoff.count() << "ms" << std::endl;
  }
  std::this_thread::sleep_for(backoff);
  return fn();
}

}  // namespace docqa_core
