#include "davgate/log-config.hpp"

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <utility>

#include "davgate/recent-log-buffer.hpp"

namespace davgate {

void LogConfig::validate() const {
  if (level < spdlog::level::trace || level >= spdlog::level::n_levels) {
    throw std::invalid_argument("Invalid log level");
  }
}

std::shared_ptr<RecentLogBuffer> InitLogging(const LogConfig& config) {
  config.validate();

  spdlog::sink_ptr consoleSink;
  if (config.useColors) {
    consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  } else {
    consoleSink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
  }
  consoleSink->set_pattern(config.displayDatetime ? "%Y-%m-%d %H:%M:%S.%e %^%l%$: [%n] %v" : "%^%l%$: [%n] %v");

  auto logger = std::make_shared<spdlog::logger>("davgate", consoleSink);

  std::shared_ptr<RecentLogBuffer> recentLogs;
  if (config.recentLinesCapacity != 0) {
    recentLogs = std::make_shared<RecentLogBuffer>(config.recentLinesCapacity);
    recentLogs->attachTo(*logger);
  }

  logger->set_level(config.level);
  spdlog::set_default_logger(std::move(logger));
  return recentLogs;
}

}  // namespace davgate
