#include "davgate/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>

#include "davgate/errno-throw.hpp"
#include "davgate/log.hpp"

namespace davgate {

File::File(const char* path) : _fd(::open(path, O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    ThrowErrno("cannot open '{}' for reading", path);
  }
  log::trace("opened '{}' as fd {}", path, _fd.fd());
}

std::size_t File::size() const {
  struct stat st{};
  if (::fstat(fd(), &st) == -1) {
    ThrowErrno("fstat of fd {}", fd());
  }
  return static_cast<std::size_t>(st.st_size);
}

void File::seek(std::size_t offset) const {
  if (::lseek(fd(), static_cast<off_t>(offset), SEEK_SET) == -1) {
    ThrowErrno("lseek of fd {} to {}", fd(), offset);
  }
}

std::size_t File::read(std::span<char> dst) const {
  ssize_t nbRead;
  do {
    nbRead = ::read(fd(), dst.data(), dst.size());
  } while (nbRead == -1 && errno == EINTR);
  if (nbRead == -1) {
    ThrowErrno("read of {} bytes from fd {}", dst.size(), fd());
  }
  return static_cast<std::size_t>(nbRead);
}

}  // namespace davgate
