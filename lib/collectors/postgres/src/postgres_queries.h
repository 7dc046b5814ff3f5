#pragma once

#include <string>

namespace pgagent {

// quote value as a SQL string literal
std::string sql_literal(const std::string& value);

std::string database_size_query(const std::string& database);

std::string lock_count_query(const std::string& database);

// stat is a column or an expression over the columns of pg_stat_database
std::string database_stat_query(const std::string& database, const char* stat);

std::string user_table_stat_query(const char* stat);

std::string bgwriter_stat_query(const char* stat);

}  // namespace pgagent
