#pragma once

// Logging goes through spdlog. Components call davgate::log::debug(...) etc. which
// routes to the spdlog default logger (see InitLogging in log-config.hpp).
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace davgate {

namespace log = spdlog;

}  // namespace davgate
