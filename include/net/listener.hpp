#pragma once

#include "core/bridge_state.hpp"
#include "logging/log.hpp"
#include "net/backoff.hpp"
#include "net/socket_ops.hpp"
#include "sessions/bridge_session.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace net = boost::asio;
using tcp = net::ip::tcp;

inline constexpr std::string_view kBusyMessage =
    "\r\nError: Device busy - another client is connected\r\n";

// Listener
// Accept loop for one protocol port. Each accepted connection asks the
// arbiter for the interpreter; a busy bridge answers with kBusyMessage and
// closes, otherwise a BridgeSession<Codec> takes the socket.
// Threading model:
// - Bind() runs on the caller's thread before the reactor starts
// - The accept loop is a coroutine on the reactor's io_context; Stop() must
//   run there too
template <typename Codec> class Listener {
public:
  Listener(BridgeState &state, std::string name)
      : state_(state), name_(std::move(name)), acceptor_(state.ioc) {}

  bridge::Status Bind(const std::string &host, std::uint16_t port) {
    auto ep = sockops::ResolveBind(state_.ioc, host, port);
    if (!ep) {
      return std::unexpected(ep.error());
    }
    return sockops::OpenAcceptor(acceptor_, *ep);
  }

  // Actual bound port (differs from the requested one when that was 0).
  std::uint16_t LocalPort() const {
    boost::system::error_code ec;
    const auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
  }

  void Start() {
    net::spawn(state_.ioc,
               [this](net::yield_context yield) { this->AcceptLoop(yield); });
  }

  void Stop() {
    stopped_ = true;
    boost::system::error_code ec;
    acceptor_.close(ec);
  }

  const std::string &Name() const { return name_; }

private:
  void AcceptLoop(net::yield_context yield) {
    retry::Backoff backoff;
    while (!stopped_) {
      auto sock = sockops::AsyncAccept(acceptor_, yield);
      if (!sock) {
        if (stopped_) {
          break;
        }
        logging::Warn(name_) << "accept error: " << sock.error().message();
        retry::WaitAsync(state_.ioc, yield, backoff.Next());
        continue;
      }
      backoff.Reset();
      if (state_.shutting_down) {
        sockops::ShutdownAndClose(*sock);
        continue;
      }
      Admit(std::move(*sock), yield);
    }
    logging::Debug(name_) << "accept loop finished";
  }

  void Admit(tcp::socket sock, net::yield_context yield) {
    const std::uint64_t id = state_.next_session_id++;
    sockops::SetTcpNoDelay(sock);
    auto session =
        std::make_shared<BridgeSession<Codec>>(id, std::move(sock), state_);
    std::weak_ptr<ISession> weak = session;
    auto acquired = state_.arbiter.Acquire(id, [weak] {
      if (auto s = weak.lock()) {
        s->Terminate();
      }
    });
    if (!acquired) {
      Reject(session->Socket(), yield);
      return;
    }
    if (!state_.process.IsAlive()) {
      logging::Info(name_) << "interpreter not running, starting it";
      if (auto st = state_.process.Restart(); !st) {
        logging::Error(name_) << "cannot start interpreter: "
                              << st.error().message();
        state_.arbiter.Release(id);
        sockops::ShutdownAndClose(session->Socket());
        return;
      }
    }
    state_.repl.Reset();
    session->Start();
  }

  void Reject(tcp::socket &sock, net::yield_context yield) {
    logging::Warn(name_) << "rejecting " << sockops::PeerName(sock)
                         << ": another client is connected";
    auto st = sockops::AsyncWriteAll(sock, net::buffer(kBusyMessage), yield);
    if (!st) {
      logging::Debug(name_) << "busy message not delivered: "
                            << st.error().message();
    }
    sockops::ShutdownAndClose(sock);
  }

  BridgeState &state_;
  std::string name_;
  tcp::acceptor acceptor_;
  bool stopped_ = false;
};
