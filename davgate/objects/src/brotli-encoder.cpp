#include "davgate/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string_view>

namespace davgate {

BrotliEncoderContext::BrotliEncoderContext(int quality, std::size_t encoderChunkSize)
    : _state(BrotliEncoderCreateInstance(nullptr, nullptr, nullptr), &BrotliEncoderDestroyInstance),
      _encoderChunkSize(encoderChunkSize) {
  if (!_state) {
    throw std::bad_alloc();
  }
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_QUALITY, static_cast<uint32_t>(quality)) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set quality failed");
  }
  // Responses eligible for compression are textual (see CompressionNegotiator).
  if (BrotliEncoderSetParameter(_state.get(), BROTLI_PARAM_MODE, BROTLI_MODE_TEXT) == BROTLI_FALSE) {
    throw std::invalid_argument("Brotli set mode failed");
  }
}

std::string_view BrotliEncoderContext::encode(std::string_view data, bool finish) {
  const auto* nextIn = reinterpret_cast<const uint8_t*>(data.data());
  const BrotliEncoderOperation op = finish ? BROTLI_OPERATION_FINISH : BROTLI_OPERATION_PROCESS;
  std::size_t availIn = data.size();

  std::size_t produced = 0;
  while (true) {
    _buf.resize(produced + _encoderChunkSize);

    auto* nextOut = reinterpret_cast<uint8_t*>(_buf.data() + produced);
    std::size_t availOut = _encoderChunkSize;

    if (BrotliEncoderCompressStream(_state.get(), op, &availIn, &nextIn, &availOut, &nextOut, nullptr) ==
        BROTLI_FALSE) {
      throw std::runtime_error("BrotliEncoderCompressStream failed");
    }
    produced += _encoderChunkSize - availOut;

    if (finish) {
      if (BrotliEncoderIsFinished(_state.get()) == BROTLI_TRUE) {
        break;
      }
    } else if (availIn == 0 && BrotliEncoderHasMoreOutput(_state.get()) == BROTLI_FALSE) {
      break;
    }
  }

  _buf.resize(produced);
  return _buf;
}

}  // namespace davgate
