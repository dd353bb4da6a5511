#pragma once

#include "core/arbiter.hpp"
#include "logging/journal.hpp"
#include "proc/interpreter_process.hpp"
#include "proc/repl_tracker.hpp"
#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace net = boost::asio;

inline constexpr const char *kBridgeSignature = "mpbridge 1.0";

// BridgeState: everything the listeners and sessions share: the single
// interpreter, the arbiter guarding it and the REPL mode tracker. Lives in
// Run() for the whole lifetime of the bridge; all mutation happens on the
// reactor thread.
struct BridgeState {
  net::io_context &ioc;
  InterpreterProcess &process;
  SessionArbiter &arbiter;
  logging::SessionJournal *journal = nullptr; // null when --journal is unset
  bool restart = true;
  std::string signature = kBridgeSignature;

  ReplTracker repl;
  bool shutting_down = false;
  std::size_t live_sessions = 0;
  std::uint64_t next_session_id = 1;
};
