#pragma once

#include "telnet/codes.hpp"
#include "util/branch.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace telnet {

struct Negotiation {
  std::uint8_t command; // WILL, WONT, DO, DONT
  std::uint8_t option;
};

// IAC SB <option> <data> IAC SE, with IAC IAC inside data already collapsed
struct Subnegotiation {
  std::uint8_t option;
  std::string data;
};

// Any other two-byte IAC command (NOP, BRK, AYT, ...)
struct Command {
  std::uint8_t command;
};

using Event = std::variant<Negotiation, Subnegotiation, Command>;

// Parser
// Incremental telnet input filter. Feed() splits the incoming wire bytes into
// application data (IAC IAC collapsed to one 0xFF) and telnet events. The
// state survives between calls, so sequences split across TCP segments are
// reassembled. Malformed input never throws: it is dropped and counted in
// Violations().
class Parser {
public:
  static constexpr std::size_t kMaxSubnegotiation = 512;

  void Feed(std::string_view in, std::string &data, std::vector<Event> &events) {
    for (char ch : in) {
      const auto b = static_cast<std::uint8_t>(ch);
      switch (mode_) {
      case Mode::normal:
        if (MPBRIDGE_UNLIKELY(b == codes::IAC)) {
          mode_ = Mode::iac_seen;
        } else if (in_sub_) {
          AppendSub(b);
        } else {
          data.push_back(ch);
        }
        break;
      case Mode::iac_seen:
        mode_ = Mode::normal;
        switch (b) {
        case codes::IAC:
          if (in_sub_) {
            AppendSub(b);
          } else {
            data.push_back(ch);
          }
          break;
        case codes::SB:
          if (in_sub_) {
            // SB inside SB: previous subnegotiation was never terminated
            ++violations_;
          }
          in_sub_ = true;
          sub_.clear();
          break;
        case codes::SE:
          FinishSub(events);
          break;
        case codes::WILL:
        case codes::WONT:
        case codes::DO:
        case codes::DONT:
          pending_ = b;
          mode_ = Mode::negotiate;
          break;
        default:
          events.emplace_back(Command{b});
          break;
        }
        break;
      case Mode::negotiate:
        events.emplace_back(Negotiation{pending_, b});
        mode_ = Mode::normal;
        break;
      }
    }
  }

  std::size_t Violations() const { return violations_; }

  bool Idle() const { return mode_ == Mode::normal && !in_sub_; }

private:
  enum class Mode { normal, iac_seen, negotiate };

  void AppendSub(std::uint8_t b) {
    if (MPBRIDGE_UNLIKELY(sub_.size() >= kMaxSubnegotiation)) {
      // runaway subnegotiation; give up on it and treat the rest as data
      ++violations_;
      in_sub_ = false;
      sub_.clear();
      return;
    }
    sub_.push_back(static_cast<char>(b));
  }

  void FinishSub(std::vector<Event> &events) {
    if (!in_sub_ || sub_.empty()) {
      ++violations_;
      in_sub_ = false;
      sub_.clear();
      return;
    }
    const auto option = static_cast<std::uint8_t>(sub_.front());
    events.emplace_back(Subnegotiation{option, sub_.substr(1)});
    in_sub_ = false;
    sub_.clear();
  }

  Mode mode_ = Mode::normal;
  bool in_sub_ = false;
  std::uint8_t pending_ = 0;
  std::string sub_;
  std::size_t violations_ = 0;
};

// Appends `data` to `out` with every 0xFF doubled.
inline void AppendEscaped(std::string &out, std::string_view data) {
  out.reserve(out.size() + data.size());
  for (char ch : data) {
    out.push_back(ch);
    if (MPBRIDGE_UNLIKELY(static_cast<std::uint8_t>(ch) == codes::IAC)) {
      out.push_back(ch);
    }
  }
}

inline std::string Escape(std::string_view data) {
  std::string out;
  AppendEscaped(out, data);
  return out;
}

inline void AppendNegotiation(std::string &out, std::uint8_t command,
                              std::uint8_t option) {
  out.push_back(static_cast<char>(codes::IAC));
  out.push_back(static_cast<char>(command));
  out.push_back(static_cast<char>(option));
}

// IAC SB <option> <payload, escaped> IAC SE
inline void AppendSubnegotiation(std::string &out, std::uint8_t option,
                                 std::string_view payload) {
  out.push_back(static_cast<char>(codes::IAC));
  out.push_back(static_cast<char>(codes::SB));
  out.push_back(static_cast<char>(option));
  AppendEscaped(out, payload);
  out.push_back(static_cast<char>(codes::IAC));
  out.push_back(static_cast<char>(codes::SE));
}

} // namespace telnet
