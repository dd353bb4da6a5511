#pragma once

#include "logging/log.hpp"
#include "telnet/codes.hpp"
#include "telnet/parser.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rfc2217 {

// COM-PORT-OPTION commands, client to server. Server replies add kServerOffset.
inline constexpr std::uint8_t SIGNATURE = 0;
inline constexpr std::uint8_t SET_BAUDRATE = 1;
inline constexpr std::uint8_t SET_DATASIZE = 2;
inline constexpr std::uint8_t SET_PARITY = 3;
inline constexpr std::uint8_t SET_STOPSIZE = 4;
inline constexpr std::uint8_t SET_CONTROL = 5;
inline constexpr std::uint8_t NOTIFY_LINESTATE = 6;
inline constexpr std::uint8_t NOTIFY_MODEMSTATE = 7;
inline constexpr std::uint8_t FLOWCONTROL_SUSPEND = 8;
inline constexpr std::uint8_t FLOWCONTROL_RESUME = 9;
inline constexpr std::uint8_t SET_LINESTATE_MASK = 10;
inline constexpr std::uint8_t SET_MODEMSTATE_MASK = 11;
inline constexpr std::uint8_t PURGE_DATA = 12;

inline constexpr std::uint8_t kServerOffset = 100;

// SET-CONTROL values
inline constexpr std::uint8_t CONTROL_REQ_FLOW_SETTING = 0;
inline constexpr std::uint8_t CONTROL_USE_NO_FLOW_CONTROL = 1;
inline constexpr std::uint8_t CONTROL_USE_SW_FLOW_CONTROL = 2;
inline constexpr std::uint8_t CONTROL_USE_HW_FLOW_CONTROL = 3;
inline constexpr std::uint8_t CONTROL_REQ_BREAK_STATE = 4;
inline constexpr std::uint8_t CONTROL_BREAK_ON = 5;
inline constexpr std::uint8_t CONTROL_BREAK_OFF = 6;
inline constexpr std::uint8_t CONTROL_REQ_DTR = 7;
inline constexpr std::uint8_t CONTROL_DTR_ON = 8;
inline constexpr std::uint8_t CONTROL_DTR_OFF = 9;
inline constexpr std::uint8_t CONTROL_REQ_RTS = 10;
inline constexpr std::uint8_t CONTROL_RTS_ON = 11;
inline constexpr std::uint8_t CONTROL_RTS_OFF = 12;

// PURGE-DATA values
inline constexpr std::uint8_t PURGE_RECEIVE_BUFFER = 1;
inline constexpr std::uint8_t PURGE_TRANSMIT_BUFFER = 2;
inline constexpr std::uint8_t PURGE_BOTH_BUFFERS = 3;

// Modem state bits
inline constexpr std::uint8_t MODEMSTATE_CD = 0x80;
inline constexpr std::uint8_t MODEMSTATE_RI = 0x40;
inline constexpr std::uint8_t MODEMSTATE_DSR = 0x20;
inline constexpr std::uint8_t MODEMSTATE_CTS = 0x10;
inline constexpr std::uint8_t MODEMSTATE_CD_CHANGE = 0x08;
inline constexpr std::uint8_t MODEMSTATE_RI_TRAILING_EDGE = 0x04;
inline constexpr std::uint8_t MODEMSTATE_DSR_CHANGE = 0x02;
inline constexpr std::uint8_t MODEMSTATE_CTS_CHANGE = 0x01;

enum class StopBits : std::uint8_t { one = 1, two = 2, one_point_five = 3 };

// Advisory serial settings of one session. The interpreter has no UART, so
// these only record what the client asked for and answer its queries.
struct SerialSettings {
  std::uint32_t baudrate = 115200;
  std::uint8_t bytesize = 8;
  char parity = 'N';
  StopBits stopbits = StopBits::one;
  bool xonxoff = false;
  bool rtscts = false;
  bool dtr = true;
  bool rts = true;
  bool break_condition = false;
};

// Virtual modem inputs: a subprocess is always "connected"
struct ModemLines {
  bool cts = true;
  bool dsr = true;
  bool ri = false;
  bool cd = true;
};

// RFC 2217 parity codes 1..5 <-> N, O, E, M, S
inline std::optional<char> ParityFromWire(std::uint8_t v) {
  static constexpr std::array<char, 5> kMap{'N', 'O', 'E', 'M', 'S'};
  if (v < 1 || v > kMap.size()) {
    return std::nullopt;
  }
  return kMap[v - 1];
}

inline std::uint8_t ParityToWire(char parity) {
  switch (parity) {
  case 'O':
    return 2;
  case 'E':
    return 3;
  case 'M':
    return 4;
  case 'S':
    return 5;
  default:
    return 1;
  }
}

enum class OptionState { requested, active, inactive, really_inactive };

// One side of one telnet option. `send_yes`/`send_no` are what we transmit to
// enable/disable it, `ack_yes`/`ack_no` what the peer answers.
struct TelnetOption {
  const char *name;
  std::uint8_t option;
  std::uint8_t send_yes;
  std::uint8_t send_no;
  std::uint8_t ack_yes;
  std::uint8_t ack_no;
  OptionState state;
  bool client_ok_on_activate = false;
  bool active = false;
};

// PortManager
// Server side of RFC 2217 for one session. Holds the negotiated telnet option
// states and the advisory serial settings; nothing here is shared between
// sessions. Incoming wire bytes go through Filter(), which returns the data
// stream for the interpreter and appends every protocol answer to `replies`.
class PortManager {
public:
  PortManager(std::string tag, std::string signature)
      : tag_(std::move(tag)), signature_(std::move(signature)) {
    using namespace telnet::codes;
    options_ = {
        TelnetOption{"ECHO", OPT_ECHO, WILL, WONT, DO, DONT,
                     OptionState::requested},
        TelnetOption{"we-SGA", OPT_SGA, WILL, WONT, DO, DONT,
                     OptionState::requested},
        TelnetOption{"they-SGA", OPT_SGA, DO, DONT, WILL, WONT,
                     OptionState::inactive},
        TelnetOption{"we-BINARY", OPT_BINARY, WILL, WONT, DO, DONT,
                     OptionState::inactive},
        TelnetOption{"they-BINARY", OPT_BINARY, DO, DONT, WILL, WONT,
                     OptionState::requested},
        TelnetOption{"we-RFC2217", OPT_COM_PORT, WILL, WONT, DO, DONT,
                     OptionState::requested, true},
        TelnetOption{"they-RFC2217", OPT_COM_PORT, DO, DONT, WILL, WONT,
                     OptionState::inactive, true},
    };
  }

  // Initial negotiation requests sent right after accept.
  std::string Greeting() const {
    std::string out;
    for (const auto &opt : options_) {
      if (opt.state == OptionState::requested) {
        telnet::AppendNegotiation(out, opt.send_yes, opt.option);
      }
    }
    return out;
  }

  void Filter(std::string_view wire, std::string &data, std::string &replies) {
    events_.clear();
    parser_.Feed(wire, data, events_);
    for (const auto &ev : events_) {
      std::visit([&](const auto &e) { Handle(e, replies); }, ev);
    }
  }

  // Sends a modem state notification when the (virtual) lines changed, or
  // unconditionally when `force` is set.
  void CheckModemLines(bool force, std::string &replies) {
    std::uint8_t state = (lines_.cts ? MODEMSTATE_CTS : 0) |
                         (lines_.dsr ? MODEMSTATE_DSR : 0) |
                         (lines_.ri ? MODEMSTATE_RI : 0) |
                         (lines_.cd ? MODEMSTATE_CD : 0);
    const std::uint8_t deltas = state ^ last_modemstate_.value_or(0);
    if (deltas & MODEMSTATE_CTS) {
      state |= MODEMSTATE_CTS_CHANGE;
    }
    if (deltas & MODEMSTATE_DSR) {
      state |= MODEMSTATE_DSR_CHANGE;
    }
    if (deltas & MODEMSTATE_RI) {
      state |= MODEMSTATE_RI_TRAILING_EDGE;
    }
    if (deltas & MODEMSTATE_CD) {
      state |= MODEMSTATE_CD_CHANGE;
    }
    if (state != last_modemstate_ || force) {
      if ((client_is_rfc2217_ && (state & modemstate_mask_)) || force) {
        SendSub(replies, NOTIFY_MODEMSTATE,
                Byte(static_cast<std::uint8_t>(state & modemstate_mask_)));
        logging::Debug(tag_) << "NOTIFY_MODEMSTATE: " << int(state);
      }
      // only the line levels are remembered; delta bits are per notification
      last_modemstate_ = static_cast<std::uint8_t>(state & 0xf0);
    }
  }

  const SerialSettings &Settings() const { return settings_; }
  bool ClientIsRfc2217() const { return client_is_rfc2217_; }
  const std::string &ClientSignature() const { return client_signature_; }
  bool RemoteFlowSuspended() const { return remote_suspend_flow_; }
  std::uint8_t LinestateMask() const { return linestate_mask_; }
  std::uint8_t ModemstateMask() const { return modemstate_mask_; }
  std::size_t Violations() const { return parser_.Violations() + violations_; }

  std::optional<OptionState> StateOf(std::string_view name) const {
    for (const auto &opt : options_) {
      if (name == opt.name) {
        return opt.state;
      }
    }
    return std::nullopt;
  }

private:
  static std::string Byte(std::uint8_t v) {
    return std::string(1, static_cast<char>(v));
  }

  void SendSub(std::string &replies, std::uint8_t command,
               std::string_view value) {
    telnet::AppendSubnegotiation(
        replies, telnet::codes::OPT_COM_PORT,
        Byte(static_cast<std::uint8_t>(command + kServerOffset)) +
            std::string(value));
  }

  void Handle(const telnet::Negotiation &n, std::string &replies) {
    using namespace telnet::codes;
    logging::Debug(tag_) << "received " << CommandName(n.command) << " "
                         << int(n.option);
    bool known = false;
    for (auto &opt : options_) {
      if (opt.option == n.option) {
        ProcessIncoming(opt, n.command, replies);
        known = true;
      }
    }
    if (!known && (n.command == WILL || n.command == DO)) {
      // refuse anything we did not offer
      telnet::AppendNegotiation(replies, n.command == WILL ? DONT : WONT,
                                n.option);
      logging::Debug(tag_) << "rejected Telnet option " << int(n.option);
    }
  }

  void ProcessIncoming(TelnetOption &opt, std::uint8_t command,
                       std::string &replies) {
    if (command == opt.ack_yes) {
      switch (opt.state) {
      case OptionState::requested:
        opt.state = OptionState::active;
        opt.active = true;
        if (opt.client_ok_on_activate) {
          OnClientOk(replies);
        }
        break;
      case OptionState::active:
        break;
      case OptionState::inactive:
        opt.state = OptionState::active;
        telnet::AppendNegotiation(replies, opt.send_yes, opt.option);
        opt.active = true;
        if (opt.client_ok_on_activate) {
          OnClientOk(replies);
        }
        break;
      case OptionState::really_inactive:
        telnet::AppendNegotiation(replies, opt.send_no, opt.option);
        break;
      }
    } else if (command == opt.ack_no) {
      switch (opt.state) {
      case OptionState::requested:
        opt.state = OptionState::inactive;
        opt.active = false;
        break;
      case OptionState::active:
        opt.state = OptionState::inactive;
        telnet::AppendNegotiation(replies, opt.send_no, opt.option);
        opt.active = false;
        break;
      case OptionState::inactive:
      case OptionState::really_inactive:
        break;
      }
    }
  }

  void OnClientOk(std::string &replies) {
    client_is_rfc2217_ = true;
    logging::Info(tag_) << "client accepts RFC 2217";
    // make sure the client gets a notification even without a change
    CheckModemLines(true, replies);
  }

  void Handle(const telnet::Command &c, std::string &) {
    logging::Debug(tag_) << "ignoring Telnet command: " << int(c.command);
  }

  void Handle(const telnet::Subnegotiation &s, std::string &replies) {
    if (s.option != telnet::codes::OPT_COM_PORT) {
      ++violations_;
      logging::Warn(tag_) << "ignoring subnegotiation for option "
                          << int(s.option);
      return;
    }
    if (s.data.empty()) {
      ++violations_;
      logging::Warn(tag_) << "empty COM-PORT-OPTION subnegotiation";
      return;
    }
    const auto cmd = static_cast<std::uint8_t>(s.data[0]);
    const std::string_view value = std::string_view(s.data).substr(1);
    const std::uint8_t arg =
        value.empty() ? 0 : static_cast<std::uint8_t>(value[0]);

    switch (cmd) {
    case SIGNATURE:
      if (!value.empty()) {
        client_signature_ = std::string(value);
        logging::Info(tag_) << "client signature: " << client_signature_;
      }
      SendSub(replies, SIGNATURE, signature_);
      break;
    case SET_BAUDRATE:
      OnSetBaudrate(value, replies);
      break;
    case SET_DATASIZE:
      if (arg >= 5 && arg <= 8) {
        settings_.bytesize = arg;
        logging::Info(tag_) << "changed data size to " << int(arg);
      } else if (arg != 0) {
        RejectValue("data size", arg);
      }
      SendSub(replies, SET_DATASIZE, Byte(settings_.bytesize));
      break;
    case SET_PARITY:
      if (arg != 0) {
        if (auto p = ParityFromWire(arg)) {
          settings_.parity = *p;
          logging::Info(tag_) << "changed parity to " << *p;
        } else {
          RejectValue("parity", arg);
        }
      }
      SendSub(replies, SET_PARITY, Byte(ParityToWire(settings_.parity)));
      break;
    case SET_STOPSIZE:
      if (arg >= 1 && arg <= 3) {
        settings_.stopbits = static_cast<StopBits>(arg);
        logging::Info(tag_) << "changed stop bits to " << int(arg);
      } else if (arg != 0) {
        RejectValue("stop bits", arg);
      }
      SendSub(replies, SET_STOPSIZE,
              Byte(static_cast<std::uint8_t>(settings_.stopbits)));
      break;
    case SET_CONTROL:
      OnSetControl(arg, replies);
      break;
    case NOTIFY_LINESTATE:
      // no real line to report on
      SendSub(replies, NOTIFY_LINESTATE, Byte(0));
      break;
    case NOTIFY_MODEMSTATE:
      CheckModemLines(true, replies);
      break;
    case FLOWCONTROL_SUSPEND:
      remote_suspend_flow_ = true;
      logging::Info(tag_) << "flow control suspend";
      break;
    case FLOWCONTROL_RESUME:
      remote_suspend_flow_ = false;
      logging::Info(tag_) << "flow control resume";
      break;
    case SET_LINESTATE_MASK:
      linestate_mask_ = arg;
      logging::Info(tag_) << "line state mask: 0x" << std::hex << int(arg);
      break;
    case SET_MODEMSTATE_MASK:
      modemstate_mask_ = arg;
      logging::Info(tag_) << "modem state mask: 0x" << std::hex << int(arg);
      break;
    case PURGE_DATA:
      if (arg >= PURGE_RECEIVE_BUFFER && arg <= PURGE_BOTH_BUFFERS) {
        logging::Info(tag_) << "purge " << int(arg);
        SendSub(replies, PURGE_DATA, Byte(arg));
      } else {
        RejectValue("PURGE_DATA", arg);
      }
      break;
    default:
      ++violations_;
      logging::Warn(tag_) << "undefined COM_PORT_OPTION: " << int(cmd);
      break;
    }
  }

  void OnSetBaudrate(std::string_view value, std::string &replies) {
    if (value.size() == 4) {
      const std::uint32_t baud =
          (std::uint32_t(std::uint8_t(value[0])) << 24) |
          (std::uint32_t(std::uint8_t(value[1])) << 16) |
          (std::uint32_t(std::uint8_t(value[2])) << 8) |
          std::uint32_t(std::uint8_t(value[3]));
      if (baud != 0) {
        settings_.baudrate = baud;
        logging::Info(tag_) << "changed baud rate to " << baud;
      }
    } else {
      ++violations_;
      logging::Warn(tag_) << "SET_BAUDRATE with " << value.size()
                          << " value bytes";
    }
    const std::uint32_t b = settings_.baudrate;
    std::string out;
    out.push_back(static_cast<char>((b >> 24) & 0xff));
    out.push_back(static_cast<char>((b >> 16) & 0xff));
    out.push_back(static_cast<char>((b >> 8) & 0xff));
    out.push_back(static_cast<char>(b & 0xff));
    SendSub(replies, SET_BAUDRATE, out);
  }

  void OnSetControl(std::uint8_t arg, std::string &replies) {
    auto ack = [&](std::uint8_t v) { SendSub(replies, SET_CONTROL, Byte(v)); };
    switch (arg) {
    case CONTROL_REQ_FLOW_SETTING:
      ack(settings_.xonxoff  ? CONTROL_USE_SW_FLOW_CONTROL
          : settings_.rtscts ? CONTROL_USE_HW_FLOW_CONTROL
                             : CONTROL_USE_NO_FLOW_CONTROL);
      break;
    case CONTROL_USE_NO_FLOW_CONTROL:
      settings_.xonxoff = false;
      settings_.rtscts = false;
      logging::Info(tag_) << "changed flow control to none";
      ack(arg);
      break;
    case CONTROL_USE_SW_FLOW_CONTROL:
      settings_.xonxoff = true;
      logging::Info(tag_) << "changed flow control to XON/XOFF";
      ack(arg);
      break;
    case CONTROL_USE_HW_FLOW_CONTROL:
      settings_.rtscts = true;
      logging::Info(tag_) << "changed flow control to RTS/CTS";
      ack(arg);
      break;
    case CONTROL_REQ_BREAK_STATE:
      ack(settings_.break_condition ? CONTROL_BREAK_ON : CONTROL_BREAK_OFF);
      break;
    case CONTROL_BREAK_ON:
    case CONTROL_BREAK_OFF:
      settings_.break_condition = arg == CONTROL_BREAK_ON;
      logging::Info(tag_) << "changed BREAK to "
                          << (settings_.break_condition ? "active" : "inactive");
      ack(arg);
      break;
    case CONTROL_REQ_DTR:
      ack(settings_.dtr ? CONTROL_DTR_ON : CONTROL_DTR_OFF);
      break;
    case CONTROL_DTR_ON:
    case CONTROL_DTR_OFF:
      settings_.dtr = arg == CONTROL_DTR_ON;
      logging::Info(tag_) << "changed DTR to "
                          << (settings_.dtr ? "active" : "inactive");
      ack(arg);
      break;
    case CONTROL_REQ_RTS:
      ack(settings_.rts ? CONTROL_RTS_ON : CONTROL_RTS_OFF);
      break;
    case CONTROL_RTS_ON:
    case CONTROL_RTS_OFF:
      settings_.rts = arg == CONTROL_RTS_ON;
      logging::Info(tag_) << "changed RTS to "
                          << (settings_.rts ? "active" : "inactive");
      ack(arg);
      break;
    default:
      logging::Warn(tag_) << "SET_CONTROL " << int(arg) << " not supported";
      break;
    }
  }

  void RejectValue(const char *what, std::uint8_t v) {
    ++violations_;
    logging::Warn(tag_) << "invalid " << what << " value " << int(v);
  }

  std::string tag_;
  std::string signature_;
  std::string client_signature_;
  telnet::Parser parser_;
  std::vector<telnet::Event> events_;
  std::vector<TelnetOption> options_;
  SerialSettings settings_;
  ModemLines lines_;
  std::optional<std::uint8_t> last_modemstate_;
  std::uint8_t linestate_mask_ = 0;
  std::uint8_t modemstate_mask_ = 0xff;
  bool client_is_rfc2217_ = false;
  bool remote_suspend_flow_ = false;
  std::size_t violations_ = 0;
};

} // namespace rfc2217
