#include "pmlink/core/clock.h"

#include <stdexcept>

namespace pmlink::core {

Timestamp SystemClock::now() {
  return now_utc();
}

FixedClock::FixedClock(const std::string_view iso8601) {
  const auto parsed = parse_iso8601(iso8601);
  if (!parsed.has_value()) {
    throw std::invalid_argument("FixedClock: unparsable timestamp " + std::string(iso8601));
  }
  fixed_ = parsed.value();
}

Timestamp FixedClock::now() {
  return fixed_;
}

}  // namespace pmlink::core
