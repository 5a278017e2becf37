#include "pmlink/core/clock.h"
#include "pmlink/core/id_generator.h"
#include "pmlink/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>

using namespace pmlink;

TEST_CASE("DeterministicIdGenerator produces a repeatable sequence", "[core][ids]") {
  core::DeterministicIdGenerator a;
  core::DeterministicIdGenerator b;

  CHECK(a.next("evt") == "evt-0");
  CHECK(a.next("evt") == "evt-1");
  CHECK(core::new_trace_id(a).value == "run-2");
  CHECK(core::new_event_id(a) == "evt-3");

  CHECK(b.next("evt") == "evt-0");
}

TEST_CASE("SystemIdGenerator stamps ids with the run clock", "[core][ids]") {
  core::FixedClock clock("2026-01-01T09:30:00.000417Z");
  core::SystemIdGenerator gen(clock);

  CHECK(core::new_trace_id(gen).value == "run-20260101T093000Z-000417-0");
  CHECK(gen.next("evt") == "evt-20260101T093000Z-000417-1");
}

TEST_CASE("SystemIdGenerator ids are unique under the system clock", "[core][ids]") {
  core::SystemClock clock;
  core::SystemIdGenerator gen(clock);
  const auto first = core::new_trace_id(gen).value;
  const auto second = core::new_trace_id(gen).value;
  CHECK(first != second);
  CHECK(first.rfind("run-", 0) == 0);
}

TEST_CASE("FixedClock returns its timestamp", "[core][clock]") {
  core::FixedClock clock("2026-01-01T00:00:00Z");
  CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
  CHECK(clock.now() == clock.now());

  // Offsets are folded into UTC and fractions are not rendered.
  core::FixedClock offset("2026-03-01T10:30:15.250+02:00");
  CHECK(offset.now_iso8601() == "2026-03-01T08:30:15Z");

  core::FixedClock from_time_point(core::parse_iso8601("2026-03-01T08:30:15Z").value());
  CHECK(from_time_point.now() == offset.now() - std::chrono::milliseconds(250));
}

TEST_CASE("FixedClock rejects an unparsable timestamp", "[core][clock]") {
  CHECK_THROWS_AS(core::FixedClock("yesterday"), std::invalid_argument);
}

TEST_CASE("RecordId compares by value", "[core][ids]") {
  CHECK(core::RecordId{"a"} == core::RecordId{"a"});
  CHECK(core::RecordId{"a"} < core::RecordId{"b"});
}
