#ifndef BENCHTEL_CORE_TIME_UTILS_HPP_
#define BENCHTEL_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace benchtel::core {

// Canonical UTC timestamp formatter used by log lines.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Wall-clock epoch seconds with sub-second precision, as stored in run summaries.
inline double ToEpochSeconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration<double>(timestamp.time_since_epoch()).count();
}

inline double SecondsBetween(std::chrono::steady_clock::time_point start,
                             std::chrono::steady_clock::time_point end) {
  return std::chrono::duration<double>(end - start).count();
}

} // namespace benchtel::core

#endif // BENCHTEL_CORE_TIME_UTILS_HPP_
