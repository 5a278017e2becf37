#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pmlink::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// parse_iso8601 parses an ISO-8601-like timestamp into a UTC time point.
//
// Accepted shapes:
//   YYYY-MM-DD
//   YYYY-MM-DD(T| )HH[:MM[:SS[.fraction]]][offset]
// where offset is "Z", "+HH:MM", "-HH:MM", "+HHMM" or "+HH".
// Timestamps without an offset are taken as UTC. Fractions are truncated to microseconds.
//
// Returns nullopt on any malformed or out-of-range input; never throws.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

// format_iso8601 renders a time point as "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
[[nodiscard]] std::string format_iso8601(Timestamp ts);

// hours_between returns |a - b| in fractional hours.
[[nodiscard]] double hours_between(Timestamp a, Timestamp b);

}  // namespace pmlink::core
