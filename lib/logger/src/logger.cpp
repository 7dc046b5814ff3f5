#include "logger.h"
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pgagent {

static constexpr const char* const kMainLogger = "main_logger";

LogManager& log_manager() noexcept {
  static auto* the_log_manager = new LogManager();
  return *the_log_manager;
}

LogManager::LogManager() noexcept {
  try {
    // async logging with a queue of 8k entries and 1 background thread to flush it
    spdlog::init_thread_pool(8192, 1);
    spdlog::set_error_handler(
        [](const std::string& msg) { std::cerr << "Log error: " << msg << "\n"; });
    logger_ = spdlog::create_async_nb<spdlog::sinks::ansicolor_stderr_sink_mt>(kMainLogger);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e %t] [%n] %^%l%$ %v");
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Log initialization failed: " << ex.what() << "\n";
    logger_ = spdlog::default_logger();
  }
}

std::shared_ptr<spdlog::logger> LogManager::Logger() noexcept { return logger_; }

void LogManager::SetLevel(spdlog::level::level_enum level) noexcept {
  spdlog::set_level(level);
  logger_->set_level(level);
}

}  // namespace pgagent
