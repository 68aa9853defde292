#include "davgate/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "davgate/log.hpp"

namespace davgate {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close reports EINTR, so it must not be retried.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("close of fd {} failed: {}", fd, std::error_code(errno, std::system_category()).message());
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace davgate
