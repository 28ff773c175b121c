#include "Logging.hpp"

#include <cstdlib>
#include <gtest/gtest.h>

namespace gatvst {
namespace {

TEST(LoggingTest, LevelDefaultsToDebug) {
  ::unsetenv("GATVST_LOG_LEVEL");
  EXPECT_EQ(Logger::levelFromEnvironment(), spdlog::level::debug);
}

TEST(LoggingTest, LevelFollowsEnvironment) {
  ::setenv("GATVST_LOG_LEVEL", "warn", 1);
  EXPECT_EQ(Logger::levelFromEnvironment(), spdlog::level::warn);
  ::setenv("GATVST_LOG_LEVEL", "nonsense", 1);
  EXPECT_EQ(Logger::levelFromEnvironment(), spdlog::level::off);
  ::unsetenv("GATVST_LOG_LEVEL");
}

TEST(LoggingTest, FileFollowsEnvironment) {
  ::unsetenv("GATVST_LOG_FILE");
  EXPECT_EQ(Logger::fileFromEnvironment(),
            std::filesystem::path("logs/gatvst.log"));
  ::setenv("GATVST_LOG_FILE", "/tmp/gatvst-run.log", 1);
  EXPECT_EQ(Logger::fileFromEnvironment(),
            std::filesystem::path("/tmp/gatvst-run.log"));
  ::unsetenv("GATVST_LOG_FILE");
}

TEST(LoggingTest, InstanceIsShared) {
  auto first = Logger::getInstance();
  auto second = Logger::getInstance();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first.get(), second.get());
}

} // namespace
} // namespace gatvst
