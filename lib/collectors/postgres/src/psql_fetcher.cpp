#include "psql_fetcher.h"
#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <cmath>
#include <fmt/format.h>

namespace pgagent {

namespace {
// psql exit status when the connection to the server could not be made
constexpr int kConnectionFailed = 2;
// exit status of the shell when the psql binary could not be found
constexpr int kCommandNotFound = 127;

// values in a libpq connection string are single quoted, with \ and ' escaped
std::string conninfo_value(const std::string& value) {
  std::string quoted{"'"};
  for (auto c : value) {
    if (c == '\'' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '\'';
  return quoted;
}

std::string first_line(const std::string& output) {
  std::vector<absl::string_view> lines = absl::StrSplit(output, '\n', absl::SkipWhitespace());
  if (lines.empty()) {
    return {};
  }
  return std::string(absl::StripAsciiWhitespace(lines.front()));
}
}  // namespace

PsqlFetcher::PsqlFetcher(PostgresConnection connection, std::string database,
                         Registry* registry) noexcept
    : StatFetcher{registry}, connection_{std::move(connection)}, database_{std::move(database)} {}

std::string PsqlFetcher::conninfo() const {
  auto info = fmt::format("dbname={} port={} connect_timeout={}", conninfo_value(database_),
                          connection_.port, connection_.connect_timeout);
  if (!connection_.host.empty()) {
    info += fmt::format(" host={}", conninfo_value(connection_.host));
  }
  if (!connection_.user.empty()) {
    info += fmt::format(" user={}", conninfo_value(connection_.user));
  }
  return info;
}

std::string PsqlFetcher::command_for(const std::string& query) const {
  // -X: skip psqlrc, -A -t: unaligned tuples only, stderr is captured to report errors
  return fmt::format("{} -X -A -t -q -v ON_ERROR_STOP=1 -d {} -c {} 2>&1", connection_.psql,
                     shell_quote(conninfo()), shell_quote(query));
}

FetchResult PsqlFetcher::result_from(const CommandOutput& out) {
  switch (out.result) {
    case read_result_t::timeout:
      return FetchResult::Failure(FetchError::Timeout, "no response from psql");
    case read_result_t::error:
      return FetchResult::Failure(FetchError::Unreachable, "unable to run psql");
    case read_result_t::success:
      break;
  }

  if (out.exit_status != 0) {
    auto message = first_line(out.output);
    auto detail = fmt::format("psql exited with status {}: {}", out.exit_status, message);
    if (out.exit_status == kConnectionFailed || out.exit_status == kCommandNotFound) {
      return FetchResult::Failure(FetchError::Unreachable, std::move(detail));
    }
    return FetchResult::Failure(FetchError::QueryFailed, std::move(detail));
  }

  auto line = first_line(out.output);
  if (line.empty()) {
    return FetchResult::Failure(FetchError::EmptyResult, "query returned no value");
  }

  double value;
  if (!absl::SimpleAtod(line, &value) || !std::isfinite(value)) {
    return FetchResult::Failure(FetchError::Malformed, fmt::format("not a number: {}", line));
  }
  return FetchResult::Success(value);
}

FetchResult PsqlFetcher::Fetch(const std::string& query) {
  auto cmd = command_for(query);
  return result_from(run_command(cmd.c_str(), connection_.query_timeout_millis));
}

}  // namespace pgagent
