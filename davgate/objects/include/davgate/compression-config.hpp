#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace davgate {

enum class CompressionLevel : std::uint8_t { Fast, Default, Best };

struct CompressionConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Codecs that are enabled here but not compiled in are silently skipped at negotiation time.
  bool enableGzip{true};
  bool enableBrotli{true};

  CompressionLevel level{CompressionLevel::Default};

  // Additional content-type regex (prefix-anchored) eligible for compression, on top of the built-in one.
  // Empty means no user rule.
  std::string contentTypeUserRule;

  // Responses with a known length strictly below this threshold are never compressed.
  std::size_t minLength{1000UL};

  // Chunk size of buffer growths during streaming compression.
  std::size_t encoderChunkSize{16UL * 1024UL};
};

// zlib level for the configured compression level (1, 4 or 9).
int GzipLevel(CompressionLevel level);

// brotli quality for the configured compression level (1, 4 or 11).
int BrotliQuality(CompressionLevel level);

}  // namespace davgate
