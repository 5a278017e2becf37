#pragma once

#include "pmlink/core/time.h"

#include <string>
#include <string_view>

namespace pmlink::core {

// IClock is the only source of wall-clock time in a pipeline run.
// It stamps generated_at, audit created_at and the run duration; a fixed
// clock makes all three reproducible.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current instant (UTC).
  virtual Timestamp now() = 0;

  // now() as "YYYY-MM-DDTHH:MM:SSZ".
  [[nodiscard]] std::string now_iso8601() { return format_iso8601(now()); }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  Timestamp now() override;
};

// FixedClock always reports the same instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed) : fixed_(fixed) {}

  // Throws std::invalid_argument when iso8601 does not parse.
  explicit FixedClock(std::string_view iso8601);

  Timestamp now() override;

 private:
  Timestamp fixed_;
};

}  // namespace pmlink::core
