#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gitreplay::timeutil {

// Native engine timestamp: seconds since the Unix epoch plus the author's
// offset in minutes east of UTC (e.g., +330 for +0530).
struct EngineTime {
  std::int64_t seconds = 0;
  int offset_minutes = 0;

  bool operator==(const EngineTime&) const = default;
};

// Absolute instant plus the fixed offset it was recorded in. Two values are
// equal only if both the instant and the offset match.
struct ZonedTime {
  std::chrono::sys_seconds instant{};
  std::chrono::minutes offset{0};

  bool operator==(const ZonedTime&) const = default;
};

// Total; never normalizes the offset.
auto to_engine_time(const ZonedTime& zt) -> EngineTime;

// Throws InvalidTimestamp if |offset| >= 24h or the instant (in UTC or in
// its own offset) falls outside calendar years 0000..9999.
auto from_engine_time(const EngineTime& et) -> ZonedTime;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Parse "+HHMM" / "-HHMM" into minutes; throws InvalidTimestamp.
auto parse_tz_offset(std::string_view text) -> int;

// "2024-04-29T20:45:45+03:00": local wall time followed by the offset.
auto format_iso8601(const ZonedTime& zt) -> std::string;

// Inverse of format_iso8601; also accepts a trailing "Z" for UTC.
// Throws InvalidTimestamp on anything else.
auto parse_iso8601(std::string_view text) -> ZonedTime;

} // namespace gitreplay::timeutil
