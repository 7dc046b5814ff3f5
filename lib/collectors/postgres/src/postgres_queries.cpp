#include "postgres_queries.h"
#include <fmt/format.h>

namespace pgagent {

std::string sql_literal(const std::string& value) {
  std::string quoted{"'"};
  for (auto c : value) {
    if (c == '\'') {
      quoted += '\'';
    }
    quoted += c;
  }
  quoted += '\'';
  return quoted;
}

std::string database_size_query(const std::string& database) {
  return fmt::format("SELECT pg_database_size({})", sql_literal(database));
}

std::string lock_count_query(const std::string& database) {
  return fmt::format(
      "SELECT count(*) FROM pg_locks l JOIN pg_database d ON l.database=d.oid WHERE d.datname={}",
      sql_literal(database));
}

std::string database_stat_query(const std::string& database, const char* stat) {
  return fmt::format("SELECT {} FROM pg_stat_database WHERE datname = {}", stat,
                     sql_literal(database));
}

std::string user_table_stat_query(const char* stat) {
  return fmt::format("SELECT {} FROM pg_stat_user_tables", stat);
}

std::string bgwriter_stat_query(const char* stat) {
  return fmt::format("SELECT {} FROM pg_stat_bgwriter", stat);
}

}  // namespace pgagent
