#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <memory>

#include "davgate/recent-log-buffer.hpp"

namespace davgate {

struct LogConfig {
  void validate() const;

  spdlog::level::level_enum level{spdlog::level::info};

  // When false, the console pattern omits the timestamp (useful when a supervisor already prefixes it).
  bool displayDatetime{true};

  bool useColors{true};

  // Number of lines kept in memory for the admin page. 0 disables the in-memory buffer.
  std::size_t recentLinesCapacity{RecentLogBuffer::kDefaultCapacity};
};

// Installs a 'davgate' logger as spdlog default logger, writing to stdout.
// Returns the in-memory buffer attached to it, or nullptr if disabled by configuration.
std::shared_ptr<RecentLogBuffer> InitLogging(const LogConfig& config);

}  // namespace davgate
