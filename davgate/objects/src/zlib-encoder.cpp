#include "davgate/zlib-encoder.hpp"

#include <fmt/format.h>
#include <zconf.h>
#include <zlib.h>

#include <cstddef>
#include <stdexcept>
#include <string_view>

#include "davgate/log.hpp"

namespace davgate {

namespace {
// Window bits above 15 ask zlib for a gzip header and trailer.
constexpr int kGzipWindowBits = MAX_WBITS + 16;
constexpr int kMemLevel = 8;
}  // namespace

ZlibEncoderContext::ZlibEncoderContext(int level, std::size_t encoderChunkSize) : _encoderChunkSize(encoderChunkSize) {
  const int ret = deflateInit2(&_stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error(fmt::format("deflateInit2 failed with level {}: {}", level, ret));
  }
}

ZlibEncoderContext::~ZlibEncoderContext() {
  // Z_DATA_ERROR is expected when a response is abandoned before its last chunk.
  if (const int ret = deflateEnd(&_stream); ret != Z_OK && ret != Z_DATA_ERROR) {
    log::warn("deflateEnd returned {}", ret);
  }
}

std::string_view ZlibEncoderContext::encode(std::string_view data, bool finish) {
  _stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  _stream.avail_in = static_cast<uInt>(data.size());

  const int flush = finish ? Z_FINISH : Z_NO_FLUSH;
  std::size_t produced = 0;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    _buf.resize(produced + _encoderChunkSize);
    _stream.next_out = reinterpret_cast<Bytef*>(_buf.data() + produced);
    _stream.avail_out = static_cast<uInt>(_encoderChunkSize);

    ret = deflate(&_stream, flush);
    if (ret == Z_STREAM_ERROR) {
      throw std::runtime_error("deflate reported an inconsistent stream state");
    }
    produced += _encoderChunkSize - _stream.avail_out;

    // Output space left over means all pending input was consumed for this flush mode.
    if (_stream.avail_out != 0 && _stream.avail_in == 0) {
      break;
    }
  }

  _buf.resize(produced);
  return _buf;
}

}  // namespace davgate
