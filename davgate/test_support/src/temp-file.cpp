#include "davgate/temp-file.hpp"

#include <stdlib.h>

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "davgate/log.hpp"

namespace davgate::test {

namespace {

std::string AlphabetCycle(std::size_t size) {
  std::string content(size, '\0');
  for (std::size_t pos = 0; pos < size; ++pos) {
    content[pos] = static_cast<char>('a' + (pos % 26U));
  }
  return content;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  std::string pattern = (std::filesystem::temp_directory_path() / prefix).string();
  pattern.append("XXXXXX");
  if (::mkdtemp(pattern.data()) == nullptr) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
  }
  _dir = pattern;
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("cannot remove temporary directory {}: {}", _dir.string(), ec.message());
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content)
    : _path(dir.dirPath() / name), _content(content) {
  std::ofstream out(_path, std::ios::binary | std::ios::trunc);
  if (!out.write(_content.data(), static_cast<std::streamsize>(_content.size()))) {
    throw std::runtime_error("cannot write temporary file " + _path.string());
  }
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::size_t size)
    : ScopedTempFile(dir, name, AlphabetCycle(size)) {}

}  // namespace davgate::test
