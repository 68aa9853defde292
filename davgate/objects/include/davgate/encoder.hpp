#pragma once

#include <memory>
#include <string_view>

#include "davgate/compression-config.hpp"
#include "davgate/compression-method.hpp"

namespace davgate {

// Stateful streaming compressor, created per response and confined to the thread sending it.
// Lifecycle: encode(chunk, false)* -> encode(lastChunk, true) -> destroy.
class EncoderContext {
 public:
  virtual ~EncoderContext() = default;

  // Feeds 'data' to the codec. When 'finish' is true, the stream is flushed and finalized.
  // Returns the compressed bytes produced by this call (possibly empty when not finishing),
  // valid until the next call on this context.
  // Throws std::runtime_error on internal codec error.
  virtual std::string_view encode(std::string_view data, bool finish) = 0;
};

// Creates a fresh streaming context for 'method'.
// Throws std::invalid_argument if 'method' is None or not compiled in this build.
std::unique_ptr<EncoderContext> MakeEncoderContext(CompressionMethod method, const CompressionConfig& config);

}  // namespace davgate
