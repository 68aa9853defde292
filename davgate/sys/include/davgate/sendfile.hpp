#pragma once

#include <sys/types.h>  // off_t

#include <cstddef>
#include <cstdint>

namespace davgate {

// Transfers up to `count` bytes from file descriptor `inFd` (at `offset`) to socket `outFd`.
// On success, `offset` is advanced by the number of bytes actually sent.
// Returns the number of bytes transferred (>= 0) or -1 on error (errno set).
int64_t Sendfile(int outFd, int inFd, off_t& offset, std::size_t count) noexcept;

}  // namespace davgate
