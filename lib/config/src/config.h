#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ConfigConstants {
  static constexpr auto DefaultPath{"/etc/default/atlas-pg-agent.conf"};
  static constexpr auto DefaultPsql{"psql"};
  static constexpr auto DefaultDatabase{"postgres"};
  static constexpr auto DefaultPort{5432};
  static constexpr auto DefaultConnectTimeoutSeconds{3};
  static constexpr auto DefaultQueryTimeoutMillis{5000};
  static constexpr auto DefaultPollIntervalSeconds{60};
};

namespace pgagent {

struct PostgresConnection {
  // psql client used to run the statistics queries
  std::string psql{ConfigConstants::DefaultPsql};
  // empty means the libpq default (unix socket)
  std::string host;
  int port{ConfigConstants::DefaultPort};
  // empty means the libpq default (current OS user)
  std::string user;
  int connect_timeout{ConfigConstants::DefaultConnectTimeoutSeconds};
  int query_timeout_millis{ConfigConstants::DefaultQueryTimeoutMillis};
};

struct AgentConfig {
  PostgresConnection connection;
  std::vector<std::string> databases{ConfigConstants::DefaultDatabase};
  int poll_interval{ConfigConstants::DefaultPollIntervalSeconds};
  // extra tags added to every metric
  std::unordered_map<std::string, std::string> tags;
};

// split a comma separated list of database names, dropping empty entries
std::vector<std::string> parse_databases(const std::string& s);

// Apply a single key=value setting to config. Returns false if the key is unknown or the
// value is invalid for it
bool apply_setting(const std::string& key, const std::string& value, AgentConfig* config);

// Parse key=value lines on top of base. Blank lines and lines starting with # are ignored,
// malformed lines and unknown keys are logged and skipped. Returns nullopt if a known key
// has an invalid value
std::optional<AgentConfig> parse_config(const std::vector<std::string>& lines,
                                        AgentConfig base = {});

// A missing file yields the defaults
std::optional<AgentConfig> parse_config_file(const std::string& path);

}  // namespace pgagent
