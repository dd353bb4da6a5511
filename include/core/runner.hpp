#pragma once

#include "core/arbiter.hpp"
#include "core/bridge_state.hpp"
#include "core/options.hpp"
#include "core/reactor.hpp"
#include "logging/journal.hpp"
#include "logging/log.hpp"
#include "net/backoff.hpp"
#include "net/listener.hpp"
#include "proc/interpreter_process.hpp"
#include "sessions/codecs.hpp"
#include <boost/algorithm/string/join.hpp>
#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <future>
#include <iostream>
#include <optional>
#include <string>

// Runner composition/threading overview:
// - Reactor: runs the io_context on 1 thread; hosts the accept loops, the
//   session coroutines, the signal handler and the interpreter's terminal
// - InterpreterProcess: one child for the whole bridge, respawned lazily by
//   the next connection after a crash
// - Listener<Rfc2217Codec> (always) and Listener<RawCodec> (unless the raw
//   port is 0) share one SessionArbiter through BridgeState
// - SessionJournal: dedicated jthread; drains the SPSC queue fed by finished
//   sessions (only with --journal)
// - Main thread: waits for SIGINT/SIGTERM or the --seconds deadline, then
//   joins the reactor and stops the interpreter
inline constexpr std::chrono::milliseconds kShutdownGrace{2000};

inline std::string ConnectUrl(const char *scheme, const std::string &host,
                              int port) {
  const std::string h =
      (host.empty() || host == "0.0.0.0" || host == "::") ? "localhost" : host;
  return std::string(scheme) + "://" + h + ":" + std::to_string(port);
}

inline int Run(const BridgeOptions &opt) {
  logging::SetVerbosity(opt.verbosity);

  // Init
  Reactor reactor;
  auto &ioc = reactor.GetIoContext();
  logging::SessionJournal journal;
  if (!opt.journal.empty()) {
    if (!journal.Open(opt.journal)) {
      logging::Error("bridge") << "cannot open journal " << opt.journal << ": "
                               << std::strerror(errno);
      return 1;
    }
    journal.Start();
  }
  const auto cmd = BuildInterpreterCommand(opt);
  InterpreterProcess process(ioc, cmd, opt.cwd);
  SessionArbiter arbiter;
  BridgeState state{ioc, process, arbiter};
  state.journal = journal.IsOpen() ? &journal : nullptr;
  state.restart = opt.restart;

  logging::Info("bridge") << "interpreter command: "
                          << boost::algorithm::join(cmd, " ");
  if (!opt.cwd.empty()) {
    logging::Info("bridge") << "interpreter working directory: " << opt.cwd;
  }
  if (auto st = process.Start(); !st) {
    logging::Error("bridge") << "cannot start " << opt.micropython_path << ": "
                             << st.error().message();
    return 1;
  }

  Listener<Rfc2217Codec> rfc2217(state, "rfc2217");
  if (auto st = rfc2217.Bind(opt.host, static_cast<std::uint16_t>(opt.rfc2217_port));
      !st) {
    logging::Error("bridge") << "could not bind RFC 2217 to "
                             << (opt.host.empty() ? "0.0.0.0" : opt.host) << ":"
                             << opt.rfc2217_port << ": " << st.error().message();
    return 1;
  }
  std::cout << "RFC 2217 server on port " << rfc2217.LocalPort()
            << ", connect with: mpremote connect "
            << ConnectUrl("rfc2217", opt.host, rfc2217.LocalPort()) << "\n";
  std::optional<Listener<RawCodec>> raw;
  if (opt.socket_port != 0) {
    raw.emplace(state, "socket");
    if (auto st = raw->Bind(opt.host, static_cast<std::uint16_t>(opt.socket_port));
        !st) {
      logging::Warn("bridge") << "could not bind raw socket to "
                              << (opt.host.empty() ? "0.0.0.0" : opt.host)
                              << ":" << opt.socket_port << ": "
                              << st.error().message();
      raw.reset();
    } else {
      std::cout << "Raw socket server on port " << raw->LocalPort()
                << ", connect with: mpremote connect "
                << ConnectUrl("socket", opt.host, raw->LocalPort()) << "\n";
    }
  }
  std::cout.flush();

  // Shutdown runs on the reactor thread: stop accepting, end the active
  // session, give the session coroutines kShutdownGrace to wind down.
  std::promise<void> stopped;
  auto stopped_future = stopped.get_future();
  net::signal_set signals(ioc, SIGINT, SIGTERM);
  auto begin_shutdown = [&] {
    if (state.shutting_down) {
      return;
    }
    state.shutting_down = true;
    boost::system::error_code ignored;
    signals.cancel(ignored);
    rfc2217.Stop();
    if (raw) {
      raw->Stop();
    }
    arbiter.ForceRelease();
    net::spawn(ioc, [&](net::yield_context yield) {
      const auto deadline = std::chrono::steady_clock::now() + kShutdownGrace;
      while (state.live_sessions > 0 &&
             std::chrono::steady_clock::now() < deadline) {
        retry::WaitAsync(ioc, yield, std::chrono::milliseconds(10));
      }
      stopped.set_value();
    });
  };
  signals.async_wait([&](const boost::system::error_code &ec, int sig) {
    if (ec) {
      return;
    }
    logging::Info("bridge") << "caught " << ::strsignal(sig)
                            << ", shutting down";
    begin_shutdown();
  });

  // Start
  rfc2217.Start();
  if (raw) {
    raw->Start();
  }
  reactor.Start(1);

  // Wait for a signal or the deadline
  if (opt.seconds > 0 &&
      stopped_future.wait_for(std::chrono::seconds(opt.seconds)) ==
          std::future_status::timeout) {
    logging::Info("bridge") << "run time of " << opt.seconds
                            << " s elapsed, shutting down";
    net::post(ioc, begin_shutdown);
  }
  stopped_future.wait();

  // Stop
  reactor.Join();
  process.Stop();
  journal.Join();
  if (journal.Dropped() > 0) {
    logging::Warn("bridge") << journal.Dropped()
                            << " journal records dropped";
  }
  return 0;
}
