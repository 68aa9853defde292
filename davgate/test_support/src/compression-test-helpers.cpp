#include "davgate/compression-test-helpers.hpp"

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef DAVGATE_ENABLE_ZLIB
#include <zlib.h>
#endif

#ifdef DAVGATE_ENABLE_BROTLI
#include <brotli/decode.h>
#endif

namespace davgate::test {

std::string GzipDecompress([[maybe_unused]] std::string_view compressed) {
#ifdef DAVGATE_ENABLE_ZLIB
  z_stream stream{};
  if (inflateInit2(&stream, MAX_WBITS + 16) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());

  std::string out;
  std::array<char, 4096> buf;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    stream.next_out = reinterpret_cast<Bytef*>(buf.data());
    stream.avail_out = static_cast<uInt>(buf.size());
    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&stream);
      throw std::runtime_error(fmt::format("inflate failed with error {}", ret));
    }
    out.append(buf.data(), buf.size() - stream.avail_out);
    if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      throw std::runtime_error("truncated gzip stream");
    }
  }
  inflateEnd(&stream);
  return out;
#else
  throw std::runtime_error("zlib support is not compiled");
#endif
}

std::string BrotliDecompress([[maybe_unused]] std::string_view compressed) {
#ifdef DAVGATE_ENABLE_BROTLI
  BrotliDecoderState* state = BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (state == nullptr) {
    throw std::runtime_error("BrotliDecoderCreateInstance failed");
  }

  const auto* nextIn = reinterpret_cast<const uint8_t*>(compressed.data());
  std::size_t availIn = compressed.size();
  std::string out;
  std::array<uint8_t, 4096> buf;
  BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
  while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    uint8_t* nextOut = buf.data();
    std::size_t availOut = buf.size();
    result = BrotliDecoderDecompressStream(state, &availIn, &nextIn, &availOut, &nextOut, nullptr);
    out.append(reinterpret_cast<const char*>(buf.data()), buf.size() - availOut);
  }
  BrotliDecoderDestroyInstance(state);
  if (result != BROTLI_DECODER_RESULT_SUCCESS) {
    throw std::runtime_error(fmt::format("brotli decompression failed with result {}", static_cast<int>(result)));
  }
  return out;
#else
  throw std::runtime_error("brotli support is not compiled");
#endif
}

}  // namespace davgate::test
