#pragma once

#include "pmlink/core/result.h"
#include "pmlink/domain/match_set.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pmlink::storage {

// StoredRun is the index entry of a persisted MatchSet.
struct StoredRun {
  std::string run_id;        // NOLINT(readability-identifier-naming)
  std::string generated_at;  // NOLINT(readability-identifier-naming)
  size_t total_matches{0};   // NOLINT(readability-identifier-naming)
};

// IMatchSetStore persists the final artifact of each run.
// A run is written once; saving the same run id twice is a conflict.
class IMatchSetStore {
 public:
  virtual ~IMatchSetStore() = default;

  [[nodiscard]] virtual core::Result<bool, core::StorageError> save(
      const std::string& run_id, const domain::MatchSet& match_set) = 0;

  [[nodiscard]] virtual std::optional<domain::MatchSet> get(const std::string& run_id) const = 0;

  // Runs ordered by run id.
  [[nodiscard]] virtual std::vector<StoredRun> list_runs() const = 0;

 protected:
  IMatchSetStore() = default;
  IMatchSetStore(const IMatchSetStore&) = default;
  IMatchSetStore& operator=(const IMatchSetStore&) = default;
  IMatchSetStore(IMatchSetStore&&) = default;
  IMatchSetStore& operator=(IMatchSetStore&&) = default;
};

class InMemoryMatchSetStore final : public IMatchSetStore {
 public:
  [[nodiscard]] core::Result<bool, core::StorageError> save(
      const std::string& run_id, const domain::MatchSet& match_set) override;
  [[nodiscard]] std::optional<domain::MatchSet> get(const std::string& run_id) const override;
  [[nodiscard]] std::vector<StoredRun> list_runs() const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, domain::MatchSet> runs_;
};

}  // namespace pmlink::storage
