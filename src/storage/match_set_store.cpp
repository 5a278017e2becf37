#include "pmlink/storage/match_set_store.h"

namespace pmlink::storage {

core::Result<bool, core::StorageError> InMemoryMatchSetStore::save(
    const std::string& run_id, const domain::MatchSet& match_set) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!runs_.emplace(run_id, match_set).second) {
    return core::Result<bool, core::StorageError>::err(core::StorageError::kConflict);
  }
  return core::Result<bool, core::StorageError>::ok(true);
}

std::optional<domain::MatchSet> InMemoryMatchSetStore::get(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<StoredRun> InMemoryMatchSetStore::list_runs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StoredRun> runs;
  runs.reserve(runs_.size());
  for (const auto& [run_id, match_set] : runs_) {
    runs.push_back(StoredRun{run_id, match_set.generated_at, match_set.matches.size()});
  }
  return runs;
}

}  // namespace pmlink::storage
