#pragma once

#include "core/bridge_state.hpp"
#include "core/isession.hpp"
#include "logging/log.hpp"
#include "logging/session_event.hpp"
#include "net/backoff.hpp"
#include "net/socket_ops.hpp"
#include "sessions/codecs.hpp"
#include "util/branch.hpp"
#include "util/time.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

// What a board prints on a soft reset, and what mpremote waits for after a
// soft reset issued from the raw REPL.
inline constexpr std::string_view kSoftRebootMessage = "soft reboot\r\n";
inline constexpr std::string_view kRawReplSoftReboot =
    "OK\r\nMPY: soft reboot\r\nraw REPL; CTRL-B to exit\r\n>";

// BridgeSession
// One admitted client, forwarding between its socket and the interpreter.
// The wire protocol is the Codec (RawCodec or Rfc2217Codec).
// Threading model:
// - Runs as coroutines (spawn) on the reactor's io_context:
//   ClientReader     socket -> codec -> interpreter
//   InterpreterReader interpreter -> codec -> outbox
//   SocketWriter     drains the outbox, so socket writes never interleave
//   Ticker           periodic codec traffic (RFC 2217 modem lines)
// - Shutdown() closes the socket and cancels the interpreter I/O; once every
//   coroutine has returned, Finish() releases the arbiter and journals the
//   session
// - Held by shared_ptr; each coroutine keeps the session alive
template <typename Codec>
class BridgeSession : public ISession,
                      public std::enable_shared_from_this<BridgeSession<Codec>> {
public:
  static constexpr std::chrono::milliseconds kReadTimeout{100};
  static constexpr std::chrono::milliseconds kTickInterval{1000};
  static constexpr std::chrono::milliseconds kHoldPoll{10};
  static constexpr std::chrono::milliseconds kExitWait{500};
  static constexpr std::chrono::milliseconds kRestartDelay{10};
  static constexpr std::chrono::milliseconds kBannerTimeout{50};
  static constexpr std::chrono::milliseconds kDrainInterval{50};
  static constexpr int kDrainAttempts = 50;
  static constexpr int kMaxEmptyDrains = 5;
  static constexpr std::size_t kReadChunk = 4096;
  static constexpr std::size_t kOutboxHighWater = 64 * 1024;

  BridgeSession(std::uint64_t id, tcp::socket socket, BridgeState &state)
      : id_(id), tag_(Codec::Tag(id)), state_(state),
        socket_(std::move(socket)), codec_(id, state.signature),
        wake_(state.ioc), tick_timer_(state.ioc),
        start_ms_(timeutil::EpochMillisUtc()),
        started_(std::chrono::steady_clock::now()) {}

  void Start() override {
    ++state_.live_sessions;
    logging::Info(tag_) << "connected from " << sockops::PeerName(socket_);
    Send(codec_.Greeting());
    auto self = this->shared_from_this();
    pending_ = Codec::kPeriodicTick ? 4 : 3;
    net::spawn(state_.ioc, [self](net::yield_context yield) {
      self->SocketWriter(yield);
      self->TaskDone();
    });
    net::spawn(state_.ioc, [self](net::yield_context yield) {
      self->ClientReader(yield);
      self->TaskDone();
    });
    net::spawn(state_.ioc, [self](net::yield_context yield) {
      self->InterpreterReader(yield);
      self->TaskDone();
    });
    if constexpr (Codec::kPeriodicTick) {
      net::spawn(state_.ioc, [self](net::yield_context yield) {
        self->Ticker(yield);
        self->TaskDone();
      });
    }
  }

  void Terminate() override {
    Shutdown(state_.shutting_down ? logging::EndReason::shutdown
                                  : logging::EndReason::interpreter_crashed);
  }

  std::uint64_t Id() const override { return id_; }

  tcp::socket &Socket() { return socket_; }

private:
  void Send(std::string bytes) {
    if (!alive_ || bytes.empty()) {
      return;
    }
    outbox_bytes_ += bytes.size();
    outbox_.push_back(std::move(bytes));
    wake_.cancel();
  }

  // interpreter data to the client, through the codec
  void Forward(std::string_view chunk) {
    state_.repl.OnInterpreterOutput(chunk);
    bytes_out_ += chunk.size();
    logging::Trace(tag_) << "interpreter -> client: "
                         << logging::Printable(chunk);
    std::string wire;
    codec_.Encode(chunk, wire);
    Send(std::move(wire));
  }

  void SocketWriter(net::yield_context yield) {
    while (alive_) {
      if (outbox_.empty()) {
        boost::system::error_code ec;
        wake_.expires_at(net::steady_timer::time_point::max());
        wake_.async_wait(yield[ec]);
        continue;
      }
      std::string chunk = std::move(outbox_.front());
      outbox_.pop_front();
      auto st = sockops::AsyncWriteAll(socket_, net::buffer(chunk), yield);
      outbox_bytes_ -= chunk.size();
      if (MPBRIDGE_UNLIKELY(!st)) {
        if (alive_) {
          logging::Warn(tag_) << "socket write: " << st.error().message();
        }
        Shutdown(logging::EndReason::socket_error);
      }
    }
  }

  void ClientReader(net::yield_context yield) {
    beast::flat_buffer buf;
    for (;;) {
      boost::system::error_code ec;
      const std::size_t n =
          socket_.async_read_some(buf.prepare(kReadChunk), yield[ec]);
      if (ec) {
        if (!alive_) {
          return;
        }
        if (ec == net::error::eof || ec == net::error::connection_reset) {
          logging::Info(tag_) << "client disconnected";
          Shutdown(logging::EndReason::client_closed);
        } else {
          logging::Warn(tag_) << "socket read: " << ec.message();
          Shutdown(logging::EndReason::socket_error);
        }
        return;
      }
      buf.commit(n);
      std::string data;
      std::string replies;
      if (auto st = codec_.Decode(
              std::string_view(static_cast<const char *>(buf.data().data()),
                               buf.size()),
              data, replies);
          !st) {
        // dropped by the codec, the session goes on
        logging::Debug(tag_) << "client input: " << st.error().message();
      }
      buf.consume(buf.size());
      Send(std::move(replies));
      if (data.empty()) {
        continue;
      }
      // held back while the interpreter restarts
      while (alive_ && restarting_) {
        retry::WaitAsync(state_.ioc, yield, kHoldPoll);
      }
      if (!alive_) {
        return;
      }
      state_.repl.OnClientInput(data);
      bytes_in_ += data.size();
      logging::Trace(tag_) << "client -> interpreter: "
                           << logging::Printable(data);
      if (auto st = state_.process.Write(yield, net::buffer(data)); !st) {
        // InterpreterReader sees the exit and decides what happens next
        logging::Debug(tag_) << "dropped " << data.size()
                             << " bytes: " << st.error().message();
      }
    }
  }

  void InterpreterReader(net::yield_context yield) {
    for (;;) {
      while (alive_ && outbox_bytes_ > kOutboxHighWater) {
        retry::WaitAsync(state_.ioc, yield, std::chrono::milliseconds(5));
      }
      if (!alive_) {
        return;
      }
      auto r = state_.process.Read(yield, pty_buf_.prepare(kReadChunk),
                                   kReadTimeout);
      if (!alive_) {
        return;
      }
      if (!r) {
        if (r.error() == net::error::operation_aborted) {
          continue;
        }
        if (r.error() !=
            bridge::make_error_code(bridge::Error::end_of_stream)) {
          logging::Warn(tag_) << "interpreter read: " << r.error().message();
        }
        if (!OnInterpreterExit(yield)) {
          return;
        }
        continue;
      }
      if (*r == 0) {
        // nothing to read; the terminal can outlive the child if it was
        // inherited, so look at the child too
        if (state_.process.PollExit() && !OnInterpreterExit(yield)) {
          return;
        }
        continue;
      }
      pty_buf_.commit(*r);
      Forward(std::string_view(
          static_cast<const char *>(pty_buf_.data().data()), pty_buf_.size()));
      pty_buf_.consume(pty_buf_.size());
    }
  }

  void Ticker(net::yield_context yield) {
    while (alive_) {
      boost::system::error_code ec;
      tick_timer_.expires_after(kTickInterval);
      tick_timer_.async_wait(yield[ec]);
      if (!alive_) {
        return;
      }
      std::string replies;
      codec_.Tick(replies);
      Send(std::move(replies));
    }
  }

  // The interpreter closed its terminal. Returns true if the session goes on
  // with a restarted interpreter.
  bool OnInterpreterExit(net::yield_context yield) {
    const auto status = state_.process.WaitForExit(yield, kExitWait);
    if (!alive_) {
      return false;
    }
    const bridge::Status exit_status =
        status ? status->Check()
               : bridge::Status(bridge::Fail(bridge::Error::process_crashed));
    const bool clean = exit_status.has_value();
    logging::Info(tag_) << "interpreter exited ("
                        << (status ? status->Describe() : "still running")
                        << ")";
    if (clean && state_.restart && SoftReboot(yield)) {
      return true;
    }
    if (!alive_) {
      return false;
    }
    logging::Warn(tag_) << (clean ? "interpreter exited"
                                  : exit_status.error().message())
                        << ", closing session";
    Shutdown(clean ? logging::EndReason::interpreter_exited
                   : logging::EndReason::interpreter_crashed);
    // respawned by the next connection
    state_.process.Stop(yield);
    state_.arbiter.ForceRelease();
    return false;
  }

  // Restarts the interpreter and replays what a board shows after a soft
  // reset, so tools like mpremote keep their session.
  bool SoftReboot(net::yield_context yield) {
    restarting_ = true;
    const bool was_raw = state_.repl.InRawRepl();
    logging::Info(tag_) << "soft reboot" << (was_raw ? " (raw REPL)" : "");
    if (!was_raw) {
      Forward(kSoftRebootMessage);
    }
    if (auto st = state_.process.Restart(); !st) {
      logging::Error(tag_) << "restart failed: " << st.error().message();
      restarting_ = false;
      return false;
    }
    retry::WaitAsync(state_.ioc, yield, kRestartDelay);
    const std::string banner = ReadOnce(yield, kBannerTimeout);
    if (alive_) {
      if (was_raw) {
        ReenterRawRepl(yield);
      } else if (!banner.empty()) {
        Forward(banner);
      }
    }
    restarting_ = false;
    return alive_;
  }

  // Puts the fresh interpreter back into raw REPL, swallowing its banner and
  // prompts, then answers the client as a board would.
  void ReenterRawRepl(net::yield_context yield) {
    retry::WaitAsync(state_.ioc, yield, kDrainInterval);
    if (!alive_) {
      return;
    }
    const char ctrl_a = ReplTracker::kCtrlA;
    if (auto st = state_.process.Write(yield, net::buffer(&ctrl_a, 1)); !st) {
      logging::Error(tag_) << "cannot re-enter raw REPL: "
                           << st.error().message();
      Forward(kSoftRebootMessage);
      return;
    }
    std::string drained;
    int empty = 0;
    for (int i = 0; i < kDrainAttempts && alive_; ++i) {
      retry::WaitAsync(state_.ioc, yield, kDrainInterval);
      const std::string chunk = ReadOnce(yield, kDrainInterval);
      if (!chunk.empty()) {
        drained += chunk;
        empty = 0;
        logging::Debug(tag_) << "raw REPL drain: " << logging::Printable(chunk);
        if (drained.find(ReplTracker::kRawBanner) != std::string::npos &&
            EndsWithPrompt(drained)) {
          break;
        }
      } else if (++empty > 2 * kMaxEmptyDrains ||
                 (empty > kMaxEmptyDrains && !drained.empty())) {
        break;
      }
    }
    logging::Debug(tag_) << "drained " << drained.size() << " bytes";
    Forward(kRawReplSoftReboot);
  }

  static bool EndsWithPrompt(std::string_view s) {
    const auto last = s.find_last_not_of(" \t\r\n");
    return last != std::string_view::npos && s[last] == '>';
  }

  std::string ReadOnce(net::yield_context yield,
                       std::chrono::milliseconds timeout) {
    auto r = state_.process.Read(yield, pty_buf_.prepare(kReadChunk), timeout);
    if (!r || *r == 0) {
      return {};
    }
    pty_buf_.commit(*r);
    std::string out(static_cast<const char *>(pty_buf_.data().data()),
                    pty_buf_.size());
    pty_buf_.consume(pty_buf_.size());
    return out;
  }

  void Shutdown(logging::EndReason reason) {
    if (!alive_) {
      return;
    }
    alive_ = false;
    reason_ = reason;
    restarting_ = false;
    state_.process.CancelIo();
    sockops::ShutdownAndClose(socket_);
    wake_.cancel();
    tick_timer_.cancel();
  }

  void TaskDone() {
    if (--pending_ == 0) {
      Finish();
    }
  }

  void Finish() {
    state_.arbiter.Release(id_);
    --state_.live_sessions;
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    logging::Info(tag_) << "closed (" << logging::EndReasonName(reason_)
                        << "), " << bytes_in_ << " bytes in, " << bytes_out_
                        << " bytes out, " << duration.count() << " ms";
    if (state_.journal) {
      state_.journal->Record(logging::SessionEvent{
          id_, Codec::kProtocol, reason_, bytes_in_, bytes_out_, start_ms_,
          static_cast<std::int64_t>(duration.count())});
    }
  }

  std::uint64_t id_;
  std::string tag_;
  BridgeState &state_;
  tcp::socket socket_;
  Codec codec_;
  net::steady_timer wake_;
  net::steady_timer tick_timer_;
  beast::flat_buffer pty_buf_;
  std::deque<std::string> outbox_;
  std::size_t outbox_bytes_ = 0;
  bool alive_ = true;
  bool restarting_ = false;
  int pending_ = 0;
  logging::EndReason reason_ = logging::EndReason::client_closed;
  std::uint64_t bytes_in_ = 0;
  std::uint64_t bytes_out_ = 0;
  std::int64_t start_ms_;
  std::chrono::steady_clock::time_point started_;
};
