#pragma once

#include <string>
#include <string_view>

namespace davgate::test {

// Decompress a complete gzip member. Throws std::runtime_error if the data is not a complete valid stream.
std::string GzipDecompress(std::string_view compressed);

// Decompress a complete brotli stream. Throws std::runtime_error if the data is not a complete valid stream.
std::string BrotliDecompress(std::string_view compressed);

// Returns true if 'data' starts with the gzip magic bytes.
inline bool HasGzipMagic(std::string_view data) {
  return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1F && static_cast<unsigned char>(data[1]) == 0x8B;
}

}  // namespace davgate::test
