#include "counter_reconciler.h"

namespace pgagent {

CounterReconciler::Entry* CounterReconciler::entry_for(const std::string& key) {
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      return it->second.get();
    }
  }

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  auto& entry = entries_[key];
  if (!entry) {
    entry = std::make_unique<Entry>();
  }
  return entry.get();
}

double CounterReconciler::Reconcile(const std::string& key, double raw_value) noexcept {
  auto entry = entry_for(key);
  std::lock_guard<std::mutex> guard(entry->mutex);
  auto& state = entry->state;

  auto candidate = raw_value + state.offset;
  if (candidate < state.last_corrected) {
    state.offset = state.last_corrected;
    candidate = state.last_corrected + raw_value;
  }
  state.last_corrected = candidate;
  return candidate;
}

std::optional<ReconciliationState> CounterReconciler::State(const std::string& key) const {
  Entry* entry;
  {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    entry = it->second.get();
  }

  std::lock_guard<std::mutex> guard(entry->mutex);
  return entry->state;
}

size_t CounterReconciler::size() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  return entries_.size();
}

}  // namespace pgagent
