#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace pgagent {

struct ReconciliationState {
  // maximum corrected value produced so far
  double last_corrected{0};
  // bias added to raw readings after a reset was detected
  double offset{0};
};

/// Turns raw counters that can be reset by the source (pg_stat_reset) into values that
/// never decrease. State is kept per key, created on first use and never removed.
///
/// Keys must be unique per logical counter: two counters sharing a key corrupt each
/// other's state. This is not checked.
///
/// Calls for different keys do not contend with each other. Calls for the same key are
/// serialized.
class CounterReconciler {
 public:
  CounterReconciler() = default;
  CounterReconciler(const CounterReconciler&) = delete;
  CounterReconciler& operator=(const CounterReconciler&) = delete;

  /// Returns the corrected value for the raw reading. A reading that would make the
  /// corrected value go down is taken as a reset of the source counter: the offset is
  /// re-anchored at the last corrected value and the reading is added on top of it.
  double Reconcile(const std::string& key, double raw_value) noexcept;

  std::optional<ReconciliationState> State(const std::string& key) const;

  size_t size() const;

 private:
  struct Entry {
    std::mutex mutex;
    ReconciliationState state;
  };

  Entry* entry_for(const std::string& key);

  mutable std::shared_mutex entries_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace pgagent
