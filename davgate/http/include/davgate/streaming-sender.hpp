#pragma once

#include <cstddef>
#include <optional>

#include "davgate/compression-method.hpp"
#include "davgate/compression-negotiator.hpp"
#include "davgate/dav-request.hpp"
#include "davgate/dav-response.hpp"
#include "davgate/response-channel.hpp"
#include "davgate/response-config.hpp"

namespace davgate {

// Part of a response content actually transmitted. 'offset' applies to in-memory and file content only,
// streams are produced from their current position. An absent count means up to the end of a stream.
struct TransmitWindow {
  std::size_t offset{0};
  std::optional<std::size_t> count;
};

// Frames and sends a DavResponse on a ResponseChannel, choosing between direct, compressed and zero-copy delivery.
// Stateless between calls: one instance serves all requests. send() blocks the calling thread while the
// zero-copy fallback reads the file.
class StreamingSender {
 public:
  // 'negotiator' must outlive this object.
  StreamingSender(const CompressionNegotiator& negotiator, ResponseConfig responseConfig);

  // Sends the whole response. Consumes its content (streams cannot be replayed) and completes its headers:
  // Authentication-Info from the request, Content-Length when known, Content-Encoding when compressed.
  // In-memory and file content are sent from the content range start, and never beyond the declared length.
  // A declared length larger than the available bytes is lowered to them before being advertised.
  // Zero-copy file content and ranged responses are never compressed.
  // Errors of the channel or of the codec are propagated.
  void send(DavResponse& response, const DavRequest& request, ResponseChannel& channel) const;

 private:
  void sendDirect(DavResponse& response, ResponseChannel& channel) const;

  void sendCompressed(DavResponse& response, CompressionMethod method, ResponseChannel& channel) const;

  void sendZeroCopyFile(const File& file, TransmitWindow window, ResponseChannel& channel) const;

  void sendFileByBlocks(const File& file, TransmitWindow window, ResponseChannel& channel) const;

  const CompressionNegotiator* _negotiator;
  ResponseConfig _responseConfig;
};

}  // namespace davgate
