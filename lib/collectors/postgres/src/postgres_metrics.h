#pragma once

#include "stat_fetcher.h"
#include <lib/counter_reconciler/src/counter_reconciler.h>
#include <memory>
#include <spectator/registry.h>
#include <unordered_map>
#include <vector>

struct PostgresConstants {
  static constexpr auto Size{"postgres.size"};
  static constexpr auto Connections{"postgres.connections"};
  static constexpr auto Locks{"postgres.locks"};
  static constexpr auto RowsDead{"postgres.rows.dead"};

  static constexpr auto BlocksHits{"postgres.blocks.hits"};
  static constexpr auto BlocksReads{"postgres.blocks.reads"};
  static constexpr auto Transactions{"postgres.transactions"};
  static constexpr auto TempWrites{"postgres.temp.writes"};
  static constexpr auto RowsFetched{"postgres.rows.fetched"};
  static constexpr auto RowsInserted{"postgres.rows.inserted"};
  static constexpr auto RowsUpdated{"postgres.rows.updated"};
  static constexpr auto RowsDeleted{"postgres.rows.deleted"};

  static constexpr auto CheckpointsTimed{"postgres.checkpoints.timed"};
  static constexpr auto CheckpointsRequested{"postgres.checkpoints.requested"};
  static constexpr auto BuffersCheckpoint{"postgres.buffers.checkpoint"};
  static constexpr auto BuffersClean{"postgres.buffers.clean"};
  static constexpr auto BuffersBackend{"postgres.buffers.backend"};

  static constexpr auto DatabaseTag{"database"};
};

namespace pgagent {

/// Publishes the statistics of one database. Counters are reconciled so that a
/// pg_stat_reset() on the server does not make them go down.
class PostgresMetrics {
 public:
  PostgresMetrics(Registry* registry, std::unique_ptr<StatFetcher> fetcher, std::string database,
                  std::unordered_map<std::string, std::string> extra_tags = {}) noexcept;

  void update_stats() noexcept;

 protected:
  struct Stat {
    const char* name;
    std::string query;
  };

  void gauge_stats() noexcept;
  void database_counter_stats() noexcept;
  void bgwriter_counter_stats() noexcept;

  // for testing
  const CounterReconciler& reconciler() const noexcept { return reconciler_; }

 private:
  void publish_counters(const std::vector<Stat>& stats) noexcept;

  Registry* registry_;
  std::unique_ptr<StatFetcher> fetcher_;
  std::string database_;
  std::unordered_map<std::string, std::string> tags_;
  CounterReconciler reconciler_;
  std::vector<Stat> gauges_;
  std::vector<Stat> database_counters_;
  std::vector<Stat> bgwriter_counters_;
};

}  // namespace pgagent
