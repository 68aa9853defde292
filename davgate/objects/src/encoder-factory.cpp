#include <fmt/format.h>

#include <memory>
#include <stdexcept>

#include "davgate/compression-config.hpp"
#include "davgate/compression-method.hpp"
#include "davgate/encoder.hpp"

#ifdef DAVGATE_ENABLE_ZLIB
#include "davgate/zlib-encoder.hpp"
#endif

#ifdef DAVGATE_ENABLE_BROTLI
#include "davgate/brotli-encoder.hpp"
#endif

namespace davgate {

std::unique_ptr<EncoderContext> MakeEncoderContext(CompressionMethod method, const CompressionConfig& config) {
  switch (method) {
#ifdef DAVGATE_ENABLE_ZLIB
    case CompressionMethod::Gzip:
      return std::make_unique<ZlibEncoderContext>(GzipLevel(config.level), config.encoderChunkSize);
#endif
#ifdef DAVGATE_ENABLE_BROTLI
    case CompressionMethod::Brotli:
      return std::make_unique<BrotliEncoderContext>(BrotliQuality(config.level), config.encoderChunkSize);
#endif
    default:
      throw std::invalid_argument(
          fmt::format("No encoder available for content encoding '{}'", GetContentEncodingStr(method)));
  }
}

}  // namespace davgate
