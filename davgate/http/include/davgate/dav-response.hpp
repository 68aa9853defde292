#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "davgate/compression-method.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/response-content.hpp"
#include "davgate/response-headers.hpp"

namespace davgate {

// Selects the default Content-Type of a response.
enum class ResponseType : std::uint8_t { Undecided, Html, Xml };

// Response envelope produced by the resource layer, and mutated by the StreamingSender
// while it is sent (Content-Length, Content-Encoding, Authentication-Info).
class DavResponse {
 public:
  // Html sets 'Content-Type: text/html', Xml 'Content-Type: application/xml'. 'extraHeaders' are merged after.
  // 'contentLength' overrides the length deduced from 'content'.
  // When both 'contentLength' (the total size of the resource) and 'contentRangeStart' are given,
  // 'Content-Range: bytes {start}-{contentLength}/{contentLength}' is added and the length to transmit
  // becomes contentLength - contentRangeStart. Throws std::invalid_argument if the start is beyond the length.
  explicit DavResponse(http::StatusCode status, ResponseHeaders extraHeaders = {},
                       ResponseType responseType = ResponseType::Html, ResponseContent content = std::string(),
                       std::optional<std::size_t> contentLength = std::nullopt,
                       std::optional<std::size_t> contentRangeStart = std::nullopt);

  // 405 response naming the offending method in its body.
  static DavResponse MethodNotAllowed(std::string_view method);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] ResponseHeaders& headers() noexcept { return _headers; }
  [[nodiscard]] const ResponseHeaders& headers() const noexcept { return _headers; }

  [[nodiscard]] ResponseContent& content() noexcept { return _content; }
  [[nodiscard]] const ResponseContent& content() const noexcept { return _content; }

  // Replaces the content. Bytes set the length to their size, Stream clears it,
  // ZeroCopyFile computes it from its count, or from the file size minus its offset.
  void setContent(ResponseContent content);

  // Number of body bytes to transmit before any compression, if known.
  [[nodiscard]] std::optional<std::size_t> contentLength() const noexcept { return _contentLength; }

  void setContentLength(std::optional<std::size_t> contentLength) noexcept { _contentLength = contentLength; }

  [[nodiscard]] bool contentRange() const noexcept { return _contentRangeStart.has_value(); }

  [[nodiscard]] std::optional<std::size_t> contentRangeStart() const noexcept { return _contentRangeStart; }

  [[nodiscard]] CompressionMethod compressionMethod() const noexcept { return _compressionMethod; }

  void setCompressionMethod(CompressionMethod method) noexcept { _compressionMethod = method; }

  // One line 'status|contentLength|contentKind|contentRange|contentRangeStart' followed by one line per header.
  [[nodiscard]] std::string describe() const;

 private:
  http::StatusCode _status;
  CompressionMethod _compressionMethod{CompressionMethod::None};
  ResponseHeaders _headers;
  ResponseContent _content;
  std::optional<std::size_t> _contentLength;
  std::optional<std::size_t> _contentRangeStart;
};

}  // namespace davgate
