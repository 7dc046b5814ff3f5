#pragma once

#include "stat_fetcher.h"
#include <lib/config/src/config.h>
#include <lib/util/src/util.h>

namespace pgagent {

/// Runs statistics queries through the psql client. Each fetch opens its own
/// connection; credentials come from the usual libpq environment (PGPASSWORD, ~/.pgpass)
class PsqlFetcher : public StatFetcher {
 public:
  PsqlFetcher(PostgresConnection connection, std::string database,
              Registry* registry = nullptr) noexcept;

  FetchResult Fetch(const std::string& query) override;

 protected:
  std::string conninfo() const;
  std::string command_for(const std::string& query) const;
  static FetchResult result_from(const CommandOutput& out);

 private:
  PostgresConnection connection_;
  std::string database_;
};

}  // namespace pgagent
