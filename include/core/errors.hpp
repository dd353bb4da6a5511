#pragma once

#include <boost/system/error_code.hpp>
#include <expected>
#include <string>
#include <type_traits>

// namespace bridge: error taxonomy of the bridge. Every fallible operation
// reports a boost::system::error_code; bridge-specific conditions live in the
// "mpbridge" category so they compare against bridge::Error values, while OS
// and Asio errors keep their own categories.
namespace bridge {

enum class Error {
  process_spawn_failed = 1,
  broken_pipe,
  end_of_stream,
  session_busy,
  protocol_violation,
  process_crashed,
};

class ErrorCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "mpbridge"; }

  std::string message(int ev) const override {
    switch (static_cast<Error>(ev)) {
    case Error::process_spawn_failed:
      return "interpreter process could not be started";
    case Error::broken_pipe:
      return "interpreter no longer accepts input";
    case Error::end_of_stream:
      return "interpreter closed its output";
    case Error::session_busy:
      return "another client is connected";
    case Error::protocol_violation:
      return "malformed telnet sequence";
    case Error::process_crashed:
      return "interpreter process crashed";
    }
    return "unknown bridge error";
  }
};

inline const boost::system::error_category &GetErrorCategory() {
  static const ErrorCategory category;
  return category;
}

inline boost::system::error_code make_error_code(Error e) {
  return {static_cast<int>(e), GetErrorCategory()};
}

using Status = std::expected<void, boost::system::error_code>;

template <typename T>
using Result = std::expected<T, boost::system::error_code>;

inline Status MakeStatus(const boost::system::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::unexpected<boost::system::error_code> Fail(Error e) {
  return std::unexpected(make_error_code(e));
}

} // namespace bridge

namespace boost::system {
template <> struct is_error_code_enum<bridge::Error> : std::true_type {};
} // namespace boost::system
