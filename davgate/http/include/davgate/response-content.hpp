#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "davgate/file.hpp"

namespace davgate {

// One piece of a streamed body. 'more' is false on the last piece.
struct BodyChunk {
  std::string data;
  bool more{false};
};

// Lazy, single pass body. The producer is called until it returns a chunk with more == false,
// and never after that.
struct StreamContent {
  std::function<BodyChunk()> next;
};

// Body read from an opened file, sent by the kernel when the transport supports it.
struct ZeroCopyFile {
  File file;
  std::optional<std::size_t> offset;
  // Number of bytes to send. When absent, the file is sent up to its end.
  std::optional<std::size_t> count;
};

// Exactly one representation is active at a time. std::string holds a fixed, eagerly known body.
using ResponseContent = std::variant<std::string, StreamContent, ZeroCopyFile>;

// Name of the active representation: "Bytes", "Stream" or "ZeroCopyFile".
std::string_view ContentKindName(const ResponseContent& content) noexcept;

}  // namespace davgate
