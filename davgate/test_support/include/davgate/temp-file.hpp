#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace davgate::test {

// Unique directory under the system temp directory, removed recursively on destruction.
class ScopedTempDir {
 public:
  // Throws std::system_error if the directory cannot be created.
  explicit ScopedTempDir(std::string_view prefix = "davgate-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(ScopedTempDir&&) = delete;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

 private:
  std::filesystem::path _dir;
};

// Regular file written inside a ScopedTempDir. The directory owns the cleanup.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content);

  // 'size' bytes cycling through 'a'..'z', so that any sub range is recognizable.
  ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::size_t size);

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }

  [[nodiscard]] const std::string& content() const noexcept { return _content; }

 private:
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace davgate::test
