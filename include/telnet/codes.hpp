#pragma once

#include <cstdint>

// Telnet command and option bytes (RFC 854/855/856/857/858, RFC 2217).
// Option names carry an OPT_ prefix; plain ECHO is a <termios.h> macro.
namespace telnet::codes {

inline constexpr std::uint8_t SE = 240;
inline constexpr std::uint8_t NOP = 241;
inline constexpr std::uint8_t SB = 250;
inline constexpr std::uint8_t WILL = 251;
inline constexpr std::uint8_t WONT = 252;
inline constexpr std::uint8_t DO = 253;
inline constexpr std::uint8_t DONT = 254;
inline constexpr std::uint8_t IAC = 255;

inline constexpr std::uint8_t OPT_BINARY = 0;
inline constexpr std::uint8_t OPT_ECHO = 1;
inline constexpr std::uint8_t OPT_SGA = 3;
inline constexpr std::uint8_t OPT_COM_PORT = 44;

inline const char *CommandName(std::uint8_t c) {
  switch (c) {
  case WILL:
    return "WILL";
  case WONT:
    return "WONT";
  case DO:
    return "DO";
  case DONT:
    return "DONT";
  default:
    return "?";
  }
}

} // namespace telnet::codes
