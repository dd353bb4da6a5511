#pragma once

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <charconv>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

inline constexpr const char *kDefaultMicropython = "/usr/local/bin/micropython";

struct BridgeOptions {
  std::string micropython_path = kDefaultMicropython;
  int rfc2217_port = 2217;
  int socket_port = 2218; // 0 = raw listener disabled
  std::string host;       // empty = all interfaces
  int verbosity = 0;
  // forwarded to the interpreter
  int mp_optimize = 0;
  std::vector<std::string> mp_impl_opts;
  int mp_verbose = 0;
  std::string micropython_args;
  std::vector<std::string> trailing;
  std::string cwd;
  // bridge behaviour
  std::string journal;
  int seconds = 0; // 0 = run until SIGINT/SIGTERM
  bool restart = true;
  bool show_help = false;
};

inline const char *Usage() {
  return "usage: mpbridge [options] [MICROPYTHON_PATH] [-- ARGS...]\n"
         "\n"
         "Serve a local MicroPython interpreter as a network serial port.\n"
         "\n"
         "  MICROPYTHON_PATH        interpreter binary (default: $MICROPYTHON_PATH\n"
         "                          or /usr/local/bin/micropython)\n"
         "  -p, --port PORT         RFC 2217 TCP port (default 2217)\n"
         "  -s, --socket-port PORT  raw socket TCP port (default 2218, 0 disables)\n"
         "  -H, --host HOST         interface to bind (default: all)\n"
         "  -v, --verbose           more bridge logging (repeatable)\n"
         "  -t, --seconds N         stop after N seconds (default: run forever)\n"
         "      --journal FILE      append one line per finished session\n"
         "      --no-restart        end the session when the interpreter exits\n"
         "  -h, --help              show this help\n"
         "\n"
         "MicroPython options:\n"
         "  -O                      bytecode optimisation (repeatable)\n"
         "  -X OPTION               implementation option, e.g. heapsize=4M\n"
         "      --mp-verbose        interpreter -v (repeatable)\n"
         "      --micropython-args ARGS  extra whitespace separated arguments\n"
         "      --cwd DIR           interpreter working directory\n"
         "\n"
         "Connect with:\n"
         "  mpremote connect socket://localhost:2218\n"
         "  mpremote connect rfc2217://localhost:2217\n";
}

namespace detail {

inline std::expected<int, std::string> ParseInt(std::string_view flag,
                                                std::string_view v) {
  int out = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc() || ptr != v.data() + v.size()) {
    return std::unexpected(std::string(flag) + ": invalid number '" +
                           std::string(v) + "'");
  }
  return out;
}

// -vvv / -OO style bundles: every character after '-' is `flag`
inline bool IsRepeatedFlag(std::string_view a, char flag) {
  if (a.size() < 2 || a[0] != '-' || a[1] == '-') {
    return false;
  }
  for (std::size_t i = 1; i < a.size(); ++i) {
    if (a[i] != flag) {
      return false;
    }
  }
  return true;
}

} // namespace detail

// Parses the bridge command line (without argv[0]). Everything after "--" is
// passed to the interpreter untouched.
inline std::expected<BridgeOptions, std::string>
ParseArgs(const std::vector<std::string> &args) {
  BridgeOptions opt;
  if (const char *env = std::getenv("MICROPYTHON_PATH"); env && *env) {
    opt.micropython_path = env;
  }
  bool have_path = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string a = args[i];
    std::string inline_value;
    bool has_inline = false;
    if (a.rfind("--", 0) == 0) {
      if (const auto eq = a.find('='); eq != std::string::npos) {
        inline_value = a.substr(eq + 1);
        a.resize(eq);
        has_inline = true;
      }
    }
    auto value = [&](std::string_view flag)
        -> std::expected<std::string, std::string> {
      if (has_inline) {
        return inline_value;
      }
      if (i + 1 >= args.size()) {
        return std::unexpected(std::string(flag) + ": missing value");
      }
      return args[++i];
    };
    auto int_value = [&](std::string_view flag)
        -> std::expected<int, std::string> {
      auto v = value(flag);
      if (!v) {
        return std::unexpected(v.error());
      }
      return detail::ParseInt(flag, *v);
    };

    if (a == "--") {
      opt.trailing.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                          args.end());
      break;
    } else if (a == "-h" || a == "--help") {
      opt.show_help = true;
    } else if (a == "-p" || a == "--port") {
      auto v = int_value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.rfc2217_port = *v;
    } else if (a == "-s" || a == "--socket-port") {
      auto v = int_value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.socket_port = *v;
    } else if (a == "-H" || a == "--host") {
      auto v = value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.host = *v;
    } else if (a == "--verbose") {
      ++opt.verbosity;
    } else if (detail::IsRepeatedFlag(a, 'v')) {
      opt.verbosity += static_cast<int>(a.size() - 1);
    } else if (detail::IsRepeatedFlag(a, 'O')) {
      opt.mp_optimize += static_cast<int>(a.size() - 1);
    } else if (a == "-X") {
      auto v = value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.mp_impl_opts.push_back(*v);
    } else if (a.size() > 2 && a.rfind("-X", 0) == 0) {
      opt.mp_impl_opts.push_back(a.substr(2));
    } else if (a == "--mp-verbose") {
      ++opt.mp_verbose;
    } else if (a == "--micropython-args") {
      auto v = value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.micropython_args = *v;
    } else if (a == "--cwd") {
      auto v = value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.cwd = *v;
    } else if (a == "--journal") {
      auto v = value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.journal = *v;
    } else if (a == "-t" || a == "--seconds") {
      auto v = int_value(a);
      if (!v) {
        return std::unexpected(v.error());
      }
      if (*v < 0) {
        return std::unexpected(a + ": must not be negative");
      }
      opt.seconds = *v;
    } else if (a == "--no-restart") {
      opt.restart = false;
    } else if (a.size() > 1 && a[0] == '-') {
      return std::unexpected("unknown option: " + a);
    } else if (!have_path) {
      opt.micropython_path = a;
      have_path = true;
    } else {
      return std::unexpected("unexpected argument: " + a);
    }
  }
  return opt;
}

inline std::expected<BridgeOptions, std::string> ParseArgs(int argc,
                                                           char **argv) {
  return ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
}

// Checks ports and paths; makes --cwd absolute.
inline std::expected<void, std::string> ValidateOptions(BridgeOptions &opt) {
  namespace fs = std::filesystem;
  if (opt.rfc2217_port < 1 || opt.rfc2217_port > 65535) {
    return std::unexpected("invalid RFC 2217 port: " +
                           std::to_string(opt.rfc2217_port));
  }
  if (opt.socket_port < 0 || opt.socket_port > 65535) {
    return std::unexpected("invalid socket port: " +
                           std::to_string(opt.socket_port));
  }
  std::error_code ec;
  if (!fs::is_regular_file(opt.micropython_path, ec)) {
    return std::unexpected("MicroPython executable not found: " +
                           opt.micropython_path);
  }
  if (::access(opt.micropython_path.c_str(), X_OK) != 0) {
    return std::unexpected("MicroPython executable is not executable: " +
                           opt.micropython_path);
  }
  if (!opt.cwd.empty()) {
    if (!fs::is_directory(opt.cwd, ec)) {
      return std::unexpected("working directory does not exist: " + opt.cwd);
    }
    opt.cwd = fs::absolute(opt.cwd, ec).string();
  }
  return {};
}

// path, -v*, -O*, -X opt*, --micropython-args words, trailing arguments
inline std::vector<std::string> BuildInterpreterCommand(const BridgeOptions &opt) {
  std::vector<std::string> cmd{opt.micropython_path};
  cmd.insert(cmd.end(), static_cast<std::size_t>(opt.mp_verbose), "-v");
  cmd.insert(cmd.end(), static_cast<std::size_t>(opt.mp_optimize), "-O");
  for (const auto &x : opt.mp_impl_opts) {
    cmd.push_back("-X");
    cmd.push_back(x);
  }
  if (!opt.micropython_args.empty()) {
    std::vector<std::string> words;
    boost::algorithm::split(words, opt.micropython_args,
                            boost::algorithm::is_any_of(" \t\n"),
                            boost::algorithm::token_compress_on);
    for (auto &w : words) {
      if (!w.empty()) {
        cmd.push_back(std::move(w));
      }
    }
  }
  cmd.insert(cmd.end(), opt.trailing.begin(), opt.trailing.end());
  return cmd;
}
