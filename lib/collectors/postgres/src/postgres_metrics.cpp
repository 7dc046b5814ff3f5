#include "postgres_metrics.h"
#include "postgres_queries.h"
#include <lib/logger/src/logger.h>

namespace pgagent {

using C = PostgresConstants;

PostgresMetrics::PostgresMetrics(Registry* registry, std::unique_ptr<StatFetcher> fetcher,
                                 std::string database,
                                 std::unordered_map<std::string, std::string> extra_tags) noexcept
    : registry_{registry},
      fetcher_{std::move(fetcher)},
      database_{std::move(database)},
      tags_{std::move(extra_tags)} {
  tags_[C::DatabaseTag] = database_;

  gauges_ = {
      {C::Size, database_size_query(database_)},
      {C::Connections, database_stat_query(database_, "SUM(numbackends)")},
      {C::Locks, lock_count_query(database_)},
      {C::RowsDead, user_table_stat_query("SUM(n_dead_tup)")},
  };

  database_counters_ = {
      {C::BlocksHits, database_stat_query(database_, "blks_hit")},
      {C::BlocksReads, database_stat_query(database_, "blks_read")},
      {C::Transactions, database_stat_query(database_, "xact_commit + xact_rollback")},
      {C::TempWrites, database_stat_query(database_, "temp_bytes")},
      {C::RowsFetched, database_stat_query(database_, "tup_fetched")},
      {C::RowsInserted, database_stat_query(database_, "tup_inserted")},
      {C::RowsUpdated, database_stat_query(database_, "tup_updated")},
      {C::RowsDeleted, database_stat_query(database_, "tup_deleted")},
  };

  bgwriter_counters_ = {
      {C::CheckpointsTimed, bgwriter_stat_query("checkpoints_timed")},
      {C::CheckpointsRequested, bgwriter_stat_query("checkpoints_req")},
      {C::BuffersCheckpoint, bgwriter_stat_query("buffers_checkpoint")},
      {C::BuffersClean, bgwriter_stat_query("buffers_clean")},
      {C::BuffersBackend, bgwriter_stat_query("buffers_backend")},
  };
}

void PostgresMetrics::update_stats() noexcept {
  gauge_stats();
  database_counter_stats();
  bgwriter_counter_stats();
}

void PostgresMetrics::gauge_stats() noexcept {
  for (const auto& stat : gauges_) {
    auto value = fetcher_->FetchRaw(stat.query);
    registry_->CreateGauge(stat.name, tags_).Set(value);
  }
}

void PostgresMetrics::database_counter_stats() noexcept { publish_counters(database_counters_); }

void PostgresMetrics::bgwriter_counter_stats() noexcept { publish_counters(bgwriter_counters_); }

void PostgresMetrics::publish_counters(const std::vector<Stat>& stats) noexcept {
  for (const auto& stat : stats) {
    auto raw = fetcher_->FetchRaw(stat.query);
    auto corrected = reconciler_.Reconcile(stat.name, raw);
    if (corrected != raw) {
      Logger()->debug("{} for {}: raw={} corrected={}", stat.name, database_, raw, corrected);
    }
    registry_->CreateMonotonicCounter(stat.name, tags_).Set(corrected);
  }
}

}  // namespace pgagent
