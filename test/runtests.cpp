#include <gtest/gtest.h>
#include <lib/logger/src/logger.h>

int main(int argc, char** argv) {
  pgagent::log_manager().SetLevel(spdlog::level::debug);
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
