#pragma once

#include <algorithm>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <cstddef>

// namespace retry: waits used by the accept loops and the interpreter
// restart path. Exponential backoff state plus a coroutine-friendly sleep.
namespace retry {

namespace net = boost::asio;

struct Backoff {
  std::size_t current_ms = 50;
  std::size_t max_ms = 2000;

  void Reset() { current_ms = 50; }
  std::size_t Next() {
    std::size_t v = current_ms;
    current_ms = std::min(max_ms, current_ms * 2);
    return v;
  }
};

inline void WaitAsync(net::io_context &ioc, net::yield_context yield,
                      std::chrono::milliseconds delay) {
  boost::system::error_code ec;
  net::steady_timer t(ioc);
  t.expires_after(delay);
  t.async_wait(yield[ec]);
  (void)ec;
}

inline void WaitAsync(net::io_context &ioc, net::yield_context yield,
                      std::size_t ms) {
  WaitAsync(ioc, yield, std::chrono::milliseconds(ms));
}

} // namespace retry
