#include "davgate/streaming-sender.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "davgate/compression-method.hpp"
#include "davgate/dav-request.hpp"
#include "davgate/dav-response.hpp"
#include "davgate/encoder.hpp"
#include "davgate/http-constants.hpp"
#include "davgate/log.hpp"
#include "davgate/response-channel.hpp"
#include "davgate/response-config.hpp"
#include "davgate/response-content.hpp"

namespace davgate {

namespace {

TransmitWindow ClampWindow(std::size_t available, std::size_t offset, std::optional<std::size_t> count) {
  const std::size_t first = std::min(offset, available);
  const std::size_t remaining = available - first;
  if (count && *count > remaining) {
    log::warn("Declared length {} exceeds the {} bytes available from offset {}", *count, remaining, offset);
  }
  return {first, count ? std::min(*count, remaining) : remaining};
}

// Range start and declared length applied to the content of 'response'.
TransmitWindow ComputeTransmitWindow(DavResponse& response) {
  const std::size_t rangeStart = response.contentRangeStart().value_or(0);
  const std::optional<std::size_t> declared = response.contentLength();
  if (const auto* pBytes = std::get_if<std::string>(&response.content())) {
    return ClampWindow(pBytes->size(), rangeStart, declared);
  }
  if (const auto* pZeroCopy = std::get_if<ZeroCopyFile>(&response.content())) {
    return ClampWindow(pZeroCopy->file.size(), pZeroCopy->offset.value_or(rangeStart), declared);
  }
  return {0, declared};
}

// Iterates over in-memory or streamed content as (data, moreBody) pieces, within a TransmitWindow.
// In-memory content is sliced in blocks; an empty body yields a single empty last piece.
// A stream is no longer pulled once the window count is reached.
class ChunkSource {
 public:
  ChunkSource(ResponseContent& content, std::size_t blockSize, TransmitWindow window)
      : _content(content), _window(window), _blockSize(blockSize) {}

  // Returned data is valid until the next call.
  std::pair<std::string_view, bool> next() {
    if (auto* pBytes = std::get_if<std::string>(&_content)) {
      const std::string_view bytes = std::string_view(*pBytes).substr(_window.offset, _window.count.value_or(0));
      const auto slice = bytes.substr(_pos, _blockSize);
      _pos += slice.size();
      return {slice, _pos < bytes.size()};
    }
    auto& stream = std::get<StreamContent>(_content);
    if (!stream.next) {
      throw std::invalid_argument("stream content has no producer");
    }
    _current = stream.next();
    std::string_view data = _current.data;
    bool more = _current.more;
    if (_window.count) {
      const std::size_t remaining = *_window.count - _pos;
      if (data.size() > remaining) {
        log::warn("Stream produced more than its declared length {}, truncated", *_window.count);
      }
      if (data.size() >= remaining) {
        data = data.substr(0, remaining);
        more = false;
      } else if (!more) {
        log::warn("Stream ended {} bytes before its declared length {}", remaining - data.size(), *_window.count);
      }
    }
    _pos += data.size();
    return {data, more};
  }

 private:
  ResponseContent& _content;
  TransmitWindow _window;
  std::size_t _blockSize;
  std::size_t _pos{0};
  BodyChunk _current;
};

// Reads until 'dst' is full or end of file. Returns the number of bytes read.
std::size_t ReadFully(const File& file, std::span<char> dst) {
  std::size_t total = 0;
  while (total < dst.size()) {
    const auto nbRead = file.read(dst.subspan(total));
    if (nbRead == 0) {
      break;
    }
    total += nbRead;
  }
  return total;
}

}  // namespace

StreamingSender::StreamingSender(const CompressionNegotiator& negotiator, ResponseConfig responseConfig)
    : _negotiator(&negotiator), _responseConfig(std::move(responseConfig)) {
  _responseConfig.validate();
}

void StreamingSender::send(DavResponse& response, const DavRequest& request, ResponseChannel& channel) const {
  if (!request.authenticationInfo.empty()) {
    response.headers().set(http::AuthenticationInfo, request.authenticationInfo);
  }
  log::debug("Sending response {}", response.describe());

  // Content-Range positions refer to the identity representation.
  CompressionMethod method = CompressionMethod::None;
  if (!std::holds_alternative<ZeroCopyFile>(response.content()) && !response.contentRange()) {
    const std::string* contentType = response.headers().find(http::ContentType);
    method = _negotiator->selectMethod(contentType == nullptr ? std::string_view() : std::string_view(*contentType),
                                       response.contentLength(), request.acceptedEncodings());
  }
  response.setCompressionMethod(method);

  if (method == CompressionMethod::None) {
    sendDirect(response, channel);
  } else {
    sendCompressed(response, method, channel);
  }
}

void StreamingSender::sendDirect(DavResponse& response, ResponseChannel& channel) const {
  const TransmitWindow window = ComputeTransmitWindow(response);
  if (window.count) {
    response.setContentLength(window.count);
    response.headers().set(http::ContentLength, std::to_string(*window.count));
  }
  channel.sendStart(response.status(), response.headers());

  if (const auto* pZeroCopy = std::get_if<ZeroCopyFile>(&response.content())) {
    sendZeroCopyFile(pZeroCopy->file, window, channel);
    return;
  }

  ChunkSource source(response.content(), _responseConfig.blockSize, window);
  for (bool moreBody = true; moreBody;) {
    const auto [data, more] = source.next();
    channel.sendBody(data, more);
    moreBody = more;
  }
}

void StreamingSender::sendCompressed(DavResponse& response, CompressionMethod method,
                                     ResponseChannel& channel) const {
  response.headers().set(http::ContentEncoding, GetContentEncodingStr(method));
  auto encoder = MakeEncoderContext(method, _negotiator->config());

  ChunkSource source(response.content(), _responseConfig.blockSize, ComputeTransmitWindow(response));
  bool first = true;
  for (bool moreBody = true; moreBody;) {
    const auto [data, more] = source.next();
    moreBody = more;
    const std::string_view out = encoder->encode(data, !moreBody);

    if (first) {
      // Compressed length is only known if the whole body came in this first piece.
      first = false;
      if (moreBody) {
        response.headers().erase(http::ContentLength);
      } else {
        response.headers().set(http::ContentLength, std::to_string(out.size()));
      }
      channel.sendStart(response.status(), response.headers());
    }

    if (!out.empty() || !moreBody) {
      channel.sendBody(out, moreBody);
    }
  }
  log::debug("Response body compressed with {}", GetContentEncodingStr(method));
}

void StreamingSender::sendZeroCopyFile(const File& file, TransmitWindow window, ResponseChannel& channel) const {
  if (channel.supportsZeroCopyFile()) {
    channel.sendZeroCopyFile(file, window.offset, window.count, false);
    return;
  }
  log::debug("Zero-copy file transmission not supported by the transport, reading by blocks");
  sendFileByBlocks(file, window, channel);
}

void StreamingSender::sendFileByBlocks(const File& file, TransmitWindow window, ResponseChannel& channel) const {
  file.seek(window.offset);

  const std::size_t expected = window.count.value_or(0);
  std::size_t remaining = expected;
  std::string block;
  while (true) {
    const std::size_t wanted = std::min(_responseConfig.blockSize, remaining);
    block.resize(wanted);
    const std::size_t nbRead = ReadFully(file, block);
    block.resize(nbRead);
    remaining -= nbRead;

    const bool endOfFile = nbRead < wanted;
    const bool last = endOfFile || remaining == 0;
    if (endOfFile) {
      log::warn("File fd # {} ended {} bytes before the expected count {}", file.fd(), remaining, expected);
    }
    channel.sendBody(block, !last);
    if (last) {
      break;
    }
  }
}

}  // namespace davgate
