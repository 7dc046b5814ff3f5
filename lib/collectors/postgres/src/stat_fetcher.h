#pragma once

#include <optional>
#include <string>
#include <spectator/registry.h>

namespace pgagent {

enum class FetchError { Unreachable, Timeout, QueryFailed, EmptyResult, Malformed };

const char* to_string(FetchError error) noexcept;

// Outcome of reading one statistic: a value, or the reason it could not be read
class FetchResult {
 public:
  static FetchResult Success(double value) noexcept { return FetchResult{value}; }
  static FetchResult Failure(FetchError error, std::string detail) noexcept {
    return FetchResult{error, std::move(detail)};
  }

  [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }
  [[nodiscard]] double value() const noexcept { return value_.value_or(0); }
  [[nodiscard]] FetchError error() const noexcept { return error_; }
  [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

 private:
  explicit FetchResult(double value) noexcept : value_{value} {}
  FetchResult(FetchError error, std::string detail) noexcept
      : error_{error}, detail_{std::move(detail)} {}

  std::optional<double> value_;
  FetchError error_{FetchError::Unreachable};
  std::string detail_;
};

/// Reads raw statistics from the database. The query selecting a statistic is the key
/// identifying it.
class StatFetcher {
 public:
  explicit StatFetcher(Registry* registry = nullptr) noexcept : registry_{registry} {}
  virtual ~StatFetcher() = default;

  virtual FetchResult Fetch(const std::string& query) = 0;

  /// Never fails: a failed fetch is logged, counted in pgagent.fetchErrors when a registry
  /// was given, and reported as 0. A counter that reads 0 after growing is handled as a
  /// reset by the reconciler, which keeps reporting the previous value.
  double FetchRaw(const std::string& query) noexcept;

 private:
  void record_failure(const std::string& query, FetchError error,
                      const std::string& detail) noexcept;

  Registry* registry_;
};

}  // namespace pgagent
