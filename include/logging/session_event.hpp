#pragma once

#include <boost/lockfree/spsc_queue.hpp>
#include <cstdint>

namespace logging {

enum class Protocol : std::uint8_t { raw, rfc2217 };

enum class EndReason : std::uint8_t {
  client_closed,
  socket_error,
  interpreter_exited,
  interpreter_crashed,
  shutdown,
};

inline const char *ProtocolName(Protocol p) {
  return p == Protocol::raw ? "socket" : "rfc2217";
}

inline const char *EndReasonName(EndReason r) {
  switch (r) {
  case EndReason::client_closed:
    return "client_closed";
  case EndReason::socket_error:
    return "socket_error";
  case EndReason::interpreter_exited:
    return "interpreter_exited";
  case EndReason::interpreter_crashed:
    return "interpreter_crashed";
  case EndReason::shutdown:
    return "shutdown";
  }
  return "unknown";
}

// One finished client session. Trivially copyable so it can travel through
// the SPSC queue without allocation.
struct SessionEvent {
  std::uint64_t session_id;
  Protocol protocol;
  EndReason reason;
  std::uint64_t bytes_in;  // client -> interpreter
  std::uint64_t bytes_out; // interpreter -> client
  std::int64_t start_ms;   // epoch millis
  std::int64_t duration_ms;
};

inline constexpr std::size_t kSessionRingCapacity = 1u << 10;

using SessionQueue = boost::lockfree::spsc_queue<
    SessionEvent, boost::lockfree::capacity<kSessionRingCapacity>>;

} // namespace logging
