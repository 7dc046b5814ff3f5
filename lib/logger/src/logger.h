#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pgagent {

class LogManager {
 public:
  LogManager() noexcept;
  std::shared_ptr<spdlog::logger> Logger() noexcept;

  // applies to every registered logger
  void SetLevel(spdlog::level::level_enum level) noexcept;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

LogManager& log_manager() noexcept;

inline std::shared_ptr<spdlog::logger> Logger() noexcept { return log_manager().Logger(); }

}  // namespace pgagent
