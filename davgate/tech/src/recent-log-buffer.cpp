#include "davgate/recent-log-buffer.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace davgate {

RecentLogBuffer::RecentLogBuffer(std::size_t capacity)
    : _ringBuffer(capacity == 0 ? nullptr : std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity)),
      _sink(_ringBuffer),
      _capacity(capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("RecentLogBuffer capacity cannot be 0");
  }
  _sink->set_pattern("%Y-%m-%d %H:%M:%S.%e %l: [%n] %v");
}

void RecentLogBuffer::attachTo(spdlog::logger& logger) const { logger.sinks().push_back(_sink); }

std::vector<std::string> RecentLogBuffer::lines() const { return _ringBuffer->last_formatted(); }

}  // namespace davgate
