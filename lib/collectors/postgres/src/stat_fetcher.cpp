#include "stat_fetcher.h"
#include <lib/logger/src/logger.h>

namespace pgagent {

const char* to_string(FetchError error) noexcept {
  switch (error) {
    case FetchError::Unreachable:
      return "unreachable";
    case FetchError::Timeout:
      return "timeout";
    case FetchError::QueryFailed:
      return "queryFailed";
    case FetchError::EmptyResult:
      return "emptyResult";
    case FetchError::Malformed:
      return "malformed";
  }
  return "unknown";
}

double StatFetcher::FetchRaw(const std::string& query) noexcept {
  try {
    auto result = Fetch(query);
    if (result.ok()) {
      return result.value();
    }
    record_failure(query, result.error(), result.detail());
  } catch (const std::exception& e) {
    record_failure(query, FetchError::QueryFailed, e.what());
  }
  return 0;
}

void StatFetcher::record_failure(const std::string& query, FetchError error,
                                 const std::string& detail) noexcept {
  Logger()->warn("Unable to fetch [{}] ({}): {}", query, to_string(error), detail);
  if (registry_ != nullptr) {
    registry_->CreateCounter("pgagent.fetchErrors", {{"error", to_string(error)}}).Increment();
  }
}

}  // namespace pgagent
