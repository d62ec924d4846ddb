#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace arena {

// -----------------------------------------------------------------------------
// Time constants and conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Millisecond constants for benchmark windows and an ISO-8601
//         formatter for timestamps that leave the engine as JSON.
//
// @details
// Internally every timestamp is int64 epoch milliseconds (see
// ITimeProvider). Only the serialization layer and log lines convert them
// to text.
//
// Thread-safety: Stateless; gmtime_r is the reentrant variant.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMsPerSecond = 1000;
inline constexpr std::int64_t kMsPerHour = 60 * 60 * kMsPerSecond;
inline constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// -------------------------------------------------------------------------
// format_iso8601
// -------------------------------------------------------------------------
// @brief  Formats epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
//
// @param  ms  Milliseconds since 1970-01-01 00:00:00 UTC. Negative values
//             are clamped to the epoch.
// -------------------------------------------------------------------------
inline std::string format_iso8601(std::int64_t ms) {
  if (ms < 0) {
    ms = 0;
  }
  const std::time_t seconds = static_cast<std::time_t>(ms / kMsPerSecond);
  const int millis = static_cast<int>(ms % kMsPerSecond);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, millis);
  return std::string(buffer);
}

}  // namespace arena
