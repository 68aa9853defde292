#include "davgate/recent-log-buffer.hpp"

#include <gtest/gtest.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "davgate/log-config.hpp"
#include "davgate/log.hpp"

namespace davgate {

namespace {

std::shared_ptr<spdlog::logger> MakeSilentLogger(const char* name) {
  auto logger = std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::trace);
  return logger;
}

}  // namespace

TEST(RecentLogBuffer, KeepsLastLines) {
  RecentLogBuffer buffer(3);
  auto logger = MakeSilentLogger("recent-test");
  buffer.attachTo(*logger);

  for (int i = 0; i < 5; ++i) {
    logger->info("line {}", i);
  }

  const auto lines = buffer.lines();
  ASSERT_EQ(lines.size(), 3U);
  EXPECT_NE(lines[0].find("line 2"), std::string::npos);
  EXPECT_NE(lines[2].find("line 4"), std::string::npos);
  EXPECT_NE(lines[2].find("[recent-test]"), std::string::npos);
}

TEST(RecentLogBuffer, EmptyAtStart) {
  RecentLogBuffer buffer;
  EXPECT_EQ(buffer.capacity(), RecentLogBuffer::kDefaultCapacity);
  EXPECT_TRUE(buffer.lines().empty());
}

TEST(RecentLogBuffer, ZeroCapacityThrows) { EXPECT_THROW(RecentLogBuffer(0), std::invalid_argument); }

TEST(LogConfig, InitLoggingInstallsDefaultLogger) {
  auto previous = spdlog::default_logger();

  LogConfig config;
  config.level = spdlog::level::debug;
  config.useColors = false;
  config.recentLinesCapacity = 10;
  auto recent = InitLogging(config);
  ASSERT_NE(recent, nullptr);

  log::debug("hello from {}", "test");
  const auto lines = recent->lines();
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_NE(lines.front().find("hello from test"), std::string::npos);

  config.recentLinesCapacity = 0;
  EXPECT_EQ(InitLogging(config), nullptr);

  spdlog::set_default_logger(previous);
}

}  // namespace davgate
