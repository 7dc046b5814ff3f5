#include "config.h"
#include <lib/logger/src/logger.h>
#include <lib/util/src/util.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace pgagent {

namespace {
bool parse_positive(const std::string& value, int* result) {
  int n;
  if (!absl::SimpleAtoi(value, &n) || n <= 0) {
    return false;
  }
  *result = n;
  return true;
}
}  // namespace

std::vector<std::string> parse_databases(const std::string& s) {
  std::vector<std::string> result;
  for (auto db : absl::StrSplit(s, ',', absl::SkipWhitespace())) {
    result.emplace_back(absl::StripAsciiWhitespace(db));
  }
  return result;
}

bool apply_setting(const std::string& key, const std::string& value, AgentConfig* config) {
  auto& conn = config->connection;
  if (key == "host") {
    conn.host = value;
  } else if (key == "port") {
    int port;
    if (!parse_positive(value, &port) || port > 65535) {
      return false;
    }
    conn.port = port;
  } else if (key == "user") {
    conn.user = value;
  } else if (key == "psql") {
    if (value.empty()) {
      return false;
    }
    conn.psql = value;
  } else if (key == "connect_timeout") {
    return parse_positive(value, &conn.connect_timeout);
  } else if (key == "query_timeout_millis") {
    return parse_positive(value, &conn.query_timeout_millis);
  } else if (key == "databases") {
    auto databases = parse_databases(value);
    if (databases.empty()) {
      return false;
    }
    config->databases = std::move(databases);
  } else if (key == "poll_interval") {
    return parse_positive(value, &config->poll_interval);
  } else if (key == "tags") {
    config->tags = parse_tags(value.c_str());
  } else {
    return false;
  }
  return true;
}

static bool is_known_key(const std::string& key) {
  static const char* const known[] = {"host",      "port",          "user",
                                      "psql",      "connect_timeout", "query_timeout_millis",
                                      "databases", "poll_interval", "tags"};
  for (auto k : known) {
    if (key == k) {
      return true;
    }
  }
  return false;
}

std::optional<AgentConfig> parse_config(const std::vector<std::string>& lines,
                                        AgentConfig base) {
  auto config = std::move(base);
  auto line_number = 0;
  for (const auto& raw_line : lines) {
    ++line_number;
    auto line = absl::StripAsciiWhitespace(raw_line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    std::pair<std::string, std::string> kv = absl::StrSplit(line, absl::MaxSplits('=', 1));
    auto key = std::string(absl::StripAsciiWhitespace(kv.first));
    auto value = std::string(absl::StripAsciiWhitespace(kv.second));
    if (key.empty() || line.find('=') == absl::string_view::npos) {
      Logger()->warn("Ignoring malformed config line {}: {}", line_number, std::string(line));
      continue;
    }
    if (!is_known_key(key)) {
      Logger()->warn("Ignoring unknown config key {} on line {}", key, line_number);
      continue;
    }
    if (!apply_setting(key, value, &config)) {
      Logger()->error("Invalid value for {} on line {}: {}", key, line_number, value);
      return std::nullopt;
    }
  }
  return config;
}

std::optional<AgentConfig> parse_config_file(const std::string& path) {
  auto lines = read_file(path);
  if (!lines) {
    Logger()->warn("Unable to read config file {}. Using defaults", path);
    return AgentConfig{};
  }
  Logger()->debug("Read {} lines from {}", lines->size(), path);
  return parse_config(*lines);
}

}  // namespace pgagent
