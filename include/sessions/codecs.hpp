#pragma once

#include "core/errors.hpp"
#include "logging/session_event.hpp"
#include "rfc2217/port_manager.hpp"
#include "telnet/parser.hpp"
#include <cstdint>
#include <string>
#include <string_view>

// Codecs plug a wire protocol into BridgeSession. A codec turns client wire
// bytes into interpreter data plus protocol replies (Decode), interpreter data
// into wire bytes (Encode), and may emit periodic protocol traffic (Tick).

// RawCodec: the socket:// protocol; bytes pass through unchanged.
class RawCodec {
public:
  static constexpr logging::Protocol kProtocol = logging::Protocol::raw;
  static constexpr bool kPeriodicTick = false;

  RawCodec(std::uint64_t, const std::string &) {}

  static std::string Tag(std::uint64_t id) {
    return "socket " + std::to_string(id);
  }

  std::string Greeting() const { return {}; }

  bridge::Status Decode(std::string_view wire, std::string &data,
                        std::string &) {
    data.append(wire);
    return {};
  }

  void Encode(std::string_view data, std::string &out) const {
    out.append(data);
  }

  void Tick(std::string &) {}
};

// Rfc2217Codec: telnet with the COM-PORT-OPTION; negotiation and the serial
// settings live in the per-session PortManager.
class Rfc2217Codec {
public:
  static constexpr logging::Protocol kProtocol = logging::Protocol::rfc2217;
  static constexpr bool kPeriodicTick = true;

  Rfc2217Codec(std::uint64_t id, const std::string &signature)
      : port_(Tag(id), signature) {}

  static std::string Tag(std::uint64_t id) {
    return "rfc2217 " + std::to_string(id);
  }

  std::string Greeting() const { return port_.Greeting(); }

  // Error::protocol_violation when the chunk held malformed telnet input;
  // data and replies are still produced for the well-formed part.
  bridge::Status Decode(std::string_view wire, std::string &data,
                        std::string &replies) {
    const std::size_t before = port_.Violations();
    port_.Filter(wire, data, replies);
    if (port_.Violations() != before) {
      return bridge::Fail(bridge::Error::protocol_violation);
    }
    return {};
  }

  void Encode(std::string_view data, std::string &out) const {
    telnet::AppendEscaped(out, data);
  }

  // modem line poll
  void Tick(std::string &replies) { port_.CheckModemLines(false, replies); }

  const rfc2217::PortManager &Port() const { return port_; }

private:
  rfc2217::PortManager port_;
};
