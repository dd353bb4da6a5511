#pragma once

#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>
#include "io/file_writer.hpp"
#include "logging/log.hpp"
#include "logging/session_event.hpp"
#include "util/branch.hpp"

namespace logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ =
        std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// SessionJournal
// Threading model:
// - Sessions finish on the reactor thread, which is the single producer of
//   the SPSC queue; the journal worker is the single consumer
// - The worker drains in batches and appends one text line per session with
//   writev, sleeping between drains
// - Record() never blocks; when the queue is full the event is dropped and
//   counted
class SessionJournal : public LoggerBase<SessionJournal> {
public:
  static constexpr std::chrono::milliseconds kDrainInterval{50};
  static constexpr int kBatch = 64;

  SessionJournal() : queue_(std::make_unique<SessionQueue>()) {}

  ~SessionJournal() {
    Join();
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  SessionJournal(const SessionJournal &) = delete;
  SessionJournal &operator=(const SessionJournal &) = delete;

  // Opens (appends to) the journal file. Returns false if it cannot be opened.
  bool Open(const std::string &path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    return fd_ != -1;
  }

  bool IsOpen() const { return fd_ != -1; }

  void Record(const SessionEvent &ev) {
    if (MPBRIDGE_UNLIKELY(!queue_->push(ev))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  std::uint64_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    while (running_.load(std::memory_order_relaxed)) {
      Drain();
      std::this_thread::sleep_for(kDrainInterval);
    }
    Drain();
  }

  // Formats one event as a journal line (without trailing newline).
  static std::size_t FormatLine(const SessionEvent &ev, char *out,
                                std::size_t cap) {
    char *p = out;
    char *end = out + cap;
    auto put_int = [&](auto v) {
      auto [ptr, ec] = std::to_chars(p, end, v);
      if (ec == std::errc()) {
        p = ptr;
      }
    };
    auto put_str = [&](const char *s) {
      while (*s && p < end) {
        *p++ = *s++;
      }
    };
    auto put_sep = [&] {
      if (p < end) {
        *p++ = ' ';
      }
    };
    put_int(ev.start_ms);
    put_sep();
    put_int(ev.session_id);
    put_sep();
    put_str(ProtocolName(ev.protocol));
    put_sep();
    put_int(ev.bytes_in);
    put_sep();
    put_int(ev.bytes_out);
    put_sep();
    put_int(ev.duration_ms);
    put_sep();
    put_str(EndReasonName(ev.reason));
    return static_cast<std::size_t>(p - out);
  }

private:
  void Drain() {
    if (MPBRIDGE_UNLIKELY(fd_ == -1)) {
      return;
    }
    SessionEvent ev;
    struct iovec iov[kBatch];
    std::array<std::array<char, 160>, kBatch> lines;
    int cnt = 0;
    while (queue_->pop(ev)) {
      auto &line = lines[static_cast<std::size_t>(cnt)];
      std::size_t len = FormatLine(ev, line.data(), line.size() - 1);
      line[len++] = '\n';
      iov[cnt] = {line.data(), len};
      if (++cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
  }

  void Flush(struct iovec *iov, int cnt) {
    if (!io::WritevAll(fd_, iov, cnt)) {
      Warn("journal") << "write failed, errno " << errno;
    }
  }

  std::unique_ptr<SessionQueue> queue_;
  int fd_ = -1;
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace logging
