#pragma once

#include <brotli/encode.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "davgate/encoder.hpp"

namespace davgate {

class BrotliEncoderContext final : public EncoderContext {
 public:
  BrotliEncoderContext(int quality, std::size_t encoderChunkSize);

  std::string_view encode(std::string_view data, bool finish) override;

 private:
  std::unique_ptr<BrotliEncoderState, void (*)(BrotliEncoderState*)> _state;
  std::string _buf;
  std::size_t _encoderChunkSize;
};

}  // namespace davgate
