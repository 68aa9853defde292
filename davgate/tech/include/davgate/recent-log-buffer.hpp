#pragma once

#include <spdlog/logger.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace davgate {

// Keeps the last formatted log lines in memory so that they can be displayed by an admin page.
// The buffer is owned by whoever creates it and attached explicitly to the loggers it should observe.
// Thread-safe (relies on spdlog's multi-threaded ring buffer sink).
class RecentLogBuffer {
 public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit RecentLogBuffer(std::size_t capacity = kDefaultCapacity);

  // Adds this buffer as a sink of 'logger'.
  void attachTo(spdlog::logger& logger) const;

  // Returns the buffered lines, oldest first. The count is bounded by the capacity.
  [[nodiscard]] std::vector<std::string> lines() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] const spdlog::sink_ptr& sink() const noexcept { return _sink; }

 private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> _ringBuffer;
  spdlog::sink_ptr _sink;
  std::size_t _capacity;
};

}  // namespace davgate
