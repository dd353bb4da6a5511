#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Thread-safe local time conversion.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

inline std::int64_t EpochMillisUtc() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

// HH:MM:SS.mmm for log lines
inline std::string ClockTime() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t tt = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm = LocalTime(tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << ms;
  return oss.str();
}

} // namespace timeutil
