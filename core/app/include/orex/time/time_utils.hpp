#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace orex {

// Wall-clock point used on every domain record (orders, lifecycle events,
// risk profiles, errors).
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Bridges ITimeProvider's int64_t epoch milliseconds and the
//         Timestamp carried by domain records.
//
// Thread-safety: Stateless, safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_iso8601
// -------------------------------------------------------------------------
// @brief  Renders a Timestamp as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC) for log
//         lines and JSON snapshots.
// -------------------------------------------------------------------------
inline std::string format_iso8601(Timestamp tp) {
  const std::int64_t ms = timestamp_to_ms(tp);
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  int millis = static_cast<int>(ms % 1000);
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return out.str();
}

}  // namespace orex
