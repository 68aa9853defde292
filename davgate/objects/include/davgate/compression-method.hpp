#pragma once

#include <cstdint>
#include <string_view>

#include "davgate/features.hpp"
#include "davgate/http-constants.hpp"

namespace davgate {

// Ordered from least to most preferred.
enum class CompressionMethod : std::uint8_t { None, Gzip, Brotli };

// Content-Encoding token of given method. None maps to identity.
constexpr std::string_view GetContentEncodingStr(CompressionMethod method) {
  switch (method) {
    case CompressionMethod::Gzip:
      return http::gzip;
    case CompressionMethod::Brotli:
      return http::br;
    default:
      return http::identity;
  }
}

// Check if the codec is compiled in this build.
constexpr bool IsCompressionMethodEnabled(CompressionMethod method) {
  switch (method) {
    case CompressionMethod::Gzip:
      return zlibEnabled();
    case CompressionMethod::Brotli:
      return brotliEnabled();
    default:
      return true;
  }
}

}  // namespace davgate
