#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace davgate {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: ThrowErrno("read failed for fd # {}", fd);
template <typename... Args>
[[noreturn]] void ThrowErrno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace davgate
