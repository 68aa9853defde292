#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "davgate/base-fd.hpp"

namespace davgate {

// Read-only regular file, source of zero-copy response bodies.
// Every failing system call throws std::system_error carrying errno.
class File {
 public:
  File() noexcept = default;

  explicit File(const char* path);

  explicit File(const std::string& path) : File(path.c_str()) {}

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Size reported by fstat, queried on each call.
  [[nodiscard]] std::size_t size() const;

  // Sets the absolute offset of the next read.
  void seek(std::size_t offset) const;

  // Reads at most dst.size() bytes from the current offset, 0 meaning end of file.
  [[nodiscard]] std::size_t read(std::span<char> dst) const;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace davgate
