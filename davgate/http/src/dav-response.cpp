#include "davgate/dav-response.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "davgate/http-constants.hpp"
#include "davgate/response-content.hpp"
#include "davgate/response-headers.hpp"

namespace davgate {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

std::string OptionalToString(std::optional<std::size_t> value) {
  return value ? std::to_string(*value) : std::string("None");
}

}  // namespace

std::string_view ContentKindName(const ResponseContent& content) noexcept {
  switch (content.index()) {
    case 0:
      return "Bytes";
    case 1:
      return "Stream";
    default:
      return "ZeroCopyFile";
  }
}

DavResponse::DavResponse(http::StatusCode status, ResponseHeaders extraHeaders, ResponseType responseType,
                         ResponseContent content, std::optional<std::size_t> contentLength,
                         std::optional<std::size_t> contentRangeStart)
    : _status(status) {
  switch (responseType) {
    case ResponseType::Html:
      _headers.set(http::ContentType, http::ContentTypeTextHtml);
      break;
    case ResponseType::Xml:
      _headers.set(http::ContentType, http::ContentTypeApplicationXml);
      break;
    default:
      break;
  }
  _headers.merge(extraHeaders);

  setContent(std::move(content));
  if (contentLength) {
    _contentLength = contentLength;
    if (contentRangeStart) {
      if (*contentRangeStart >* contentLength) {
        throw std::invalid_argument(
            fmt::format("Content range start {} is beyond content length {}", *contentRangeStart, *contentLength));
      }
      // range end is the total length, not the last byte position
      _contentRangeStart = contentRangeStart;
      _contentLength = *contentLength - *contentRangeStart;
      _headers.set(http::ContentRange,
                   fmt::format("bytes {}-{}/{}", *contentRangeStart, *contentLength, *contentLength));
    }
  }
}

DavResponse DavResponse::MethodNotAllowed(std::string_view method) {
  std::string body = fmt::format("method:{} is not support method", method);
  const auto bodyLen = body.size();
  return DavResponse(http::StatusCodeMethodNotAllowed, {}, ResponseType::Html, std::move(body), bodyLen);
}

void DavResponse::setContent(ResponseContent content) {
  _content = std::move(content);
  _contentLength = std::visit(Overloaded{
                                  [](const std::string& bytes) -> std::optional<std::size_t> { return bytes.size(); },
                                  [](const StreamContent&) -> std::optional<std::size_t> { return std::nullopt; },
                                  [](const ZeroCopyFile& zeroCopy) -> std::optional<std::size_t> {
                                    if (zeroCopy.count) {
                                      return zeroCopy.count;
                                    }
                                    const std::size_t fileSize = zeroCopy.file.size();
                                    const std::size_t offset = zeroCopy.offset.value_or(0);
                                    return offset < fileSize ? fileSize - offset : 0;
                                  },
                              },
                              _content);
}

std::string DavResponse::describe() const {
  std::string out = fmt::format("{}|{}|{}|{}|{}", _status, OptionalToString(_contentLength), ContentKindName(_content),
                                contentRange() ? "True" : "False", OptionalToString(_contentRangeStart));
  for (const auto &[name, value] : _headers) {
    out.push_back('\n');
    out.append(name);
    out.append(http::HeaderSep);
    out.append(value);
  }
  return out;
}

}  // namespace davgate
