#pragma once

#include <zlib.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "davgate/encoder.hpp"

namespace davgate {

// Gzip framed deflate stream. One context per response body.
class ZlibEncoderContext final : public EncoderContext {
 public:
  // Throws std::runtime_error if the deflate stream cannot be initialized.
  ZlibEncoderContext(int level, std::size_t encoderChunkSize);

  ZlibEncoderContext(const ZlibEncoderContext&) = delete;
  ZlibEncoderContext(ZlibEncoderContext&&) = delete;
  ZlibEncoderContext& operator=(const ZlibEncoderContext&) = delete;
  ZlibEncoderContext& operator=(ZlibEncoderContext&&) = delete;

  ~ZlibEncoderContext() override;

  std::string_view encode(std::string_view data, bool finish) override;

 private:
  std::string _buf;
  std::size_t _encoderChunkSize;
  z_stream _stream{};
};

}  // namespace davgate
