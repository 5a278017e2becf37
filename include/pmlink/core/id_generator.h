#pragma once

#include "pmlink/core/clock.h"

#include <atomic>
#include <string>
#include <string_view>

namespace pmlink::core {

// IIdGenerator mints the ids of a match run: the run id under which the
// MatchSet is persisted and one id per audit event.
// Contract: next(prefix) returns prefix + "-" + a suffix that never repeats
// within one generator.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// SystemIdGenerator stamps ids with the run clock, so a run id read back from
// `pmlink runs list` says when the run started:
//
//   run-20260101T093000Z-000417-0
//       ^ UTC second    ^ micros ^ counter
//
// The microsecond field separates runs started in the same second by
// different processes; the counter separates ids minted by this generator.
// Thread-safe as long as the clock is.
class SystemIdGenerator final : public IIdGenerator {
 public:
  explicit SystemIdGenerator(IClock& clock) : clock_(clock) {}
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  IClock& clock_;
  std::atomic<unsigned long long> counter_{0};
};

// DeterministicIdGenerator numbers ids 0, 1, 2... per generator, so a run
// replayed with a FixedClock yields a byte-identical audit trail.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace pmlink::core
