#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the single io_context shared by the listeners, the sessions and the
//   interpreter's terminal
// - Runs io_context::run() on N std::jthread workers; the bridge uses 1, so
//   all bridge state is touched from one thread only
class Reactor {
public:
  Reactor() = default;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  // Stop() and wait for the workers to leave run().
  void Join() {
    Stop();
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  ~Reactor() { Join(); }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
