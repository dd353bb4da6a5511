#pragma once

#include "util/time.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

// namespace logging: diagnostics for the bridge.
// Lines go to stderr as "HH:MM:SS.mmm LEVEL [tag] message". One global
// threshold selected from the -v count; a line is formatted only when its
// level passes the threshold.
namespace logging {

enum class Level : int { error = 0, warning = 1, info = 2, debug = 3, trace = 4 };

inline std::atomic<int> &Threshold() {
  static std::atomic<int> threshold{static_cast<int>(Level::warning)};
  return threshold;
}

// -v count → threshold: 0 warnings, 1 info, 2 debug, 3+ trace
inline void SetVerbosity(int verbosity) {
  const int v = std::clamp(verbosity, 0, 3);
  Threshold().store(static_cast<int>(Level::warning) + v,
                    std::memory_order_relaxed);
}

inline bool Enabled(Level level) {
  return static_cast<int>(level) <= Threshold().load(std::memory_order_relaxed);
}

inline const char *LevelName(Level level) {
  switch (level) {
  case Level::error:
    return "ERROR";
  case Level::warning:
    return "WARN ";
  case Level::info:
    return "INFO ";
  case Level::debug:
    return "DEBUG";
  case Level::trace:
    return "TRACE";
  }
  return "?";
}

inline void Write(Level level, std::string_view tag, std::string_view msg) {
  static std::mutex m;
  std::lock_guard<std::mutex> lock(m);
  std::cerr << timeutil::ClockTime() << ' ' << LevelName(level) << " [" << tag
            << "] " << msg << "\n";
}

// Line: collects one message with operator<< and emits it on destruction.
//   logging::Line(logging::Level::info, "bridge") << "listening on " << port;
class Line {
public:
  Line(Level level, std::string tag)
      : level_(level), tag_(std::move(tag)), enabled_(Enabled(level)) {}

  Line(const Line &) = delete;
  Line &operator=(const Line &) = delete;

  ~Line() {
    if (enabled_) {
      Write(level_, tag_, oss_.str());
    }
  }

  template <typename T> Line &operator<<(const T &value) {
    if (enabled_) {
      oss_ << value;
    }
    return *this;
  }

private:
  Level level_;
  std::string tag_;
  bool enabled_;
  std::ostringstream oss_;
};

inline Line Error(std::string tag) { return Line(Level::error, std::move(tag)); }
inline Line Warn(std::string tag) { return Line(Level::warning, std::move(tag)); }
inline Line Info(std::string tag) { return Line(Level::info, std::move(tag)); }
inline Line Debug(std::string tag) { return Line(Level::debug, std::move(tag)); }
inline Line Trace(std::string tag) { return Line(Level::trace, std::move(tag)); }

// Printable form of a byte chunk for trace logs: printable ASCII kept,
// everything else as \xNN, truncated to `limit` input bytes.
inline std::string Printable(std::string_view bytes, std::size_t limit = 100) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  const std::size_t n = std::min(bytes.size(), limit);
  out.reserve(n + 8);
  for (std::size_t i = 0; i < n; ++i) {
    const auto c = static_cast<std::uint8_t>(bytes[i]);
    if (c == '\r') {
      out += "\\r";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c >= 0x20 && c < 0x7f && c != '\\') {
      out.push_back(static_cast<char>(c));
    } else {
      out += "\\x";
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  if (bytes.size() > limit) {
    out += "...";
  }
  return out;
}

} // namespace logging
