#pragma once

#include <string_view>

#include "davgate/http-status-code.hpp"

namespace davgate::http {

// Header names are stored in their conventional canonical form for emission.
// Lookups must stay case-insensitive.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PROPFIND = "PROPFIND";

// Headers
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view WWWAuthenticate = "WWW-Authenticate";
inline constexpr std::string_view AuthenticationInfo = "Authentication-Info";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

// Compression
inline constexpr std::string_view identity = "identity";
inline constexpr std::string_view gzip = "gzip";
inline constexpr std::string_view br = "br";

inline constexpr std::string_view chunked = "chunked";

// Reason Phrases (only those we currently emit explicitly)
inline constexpr std::string_view ReasonOK = "OK";                                    // 200
inline constexpr std::string_view ReasonCreated = "Created";                          // 201
inline constexpr std::string_view ReasonNoContent = "No Content";                     // 204
inline constexpr std::string_view ReasonPartialContent = "Partial Content";           // 206
inline constexpr std::string_view ReasonMultiStatus = "Multi-Status";                 // 207
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                   // 400
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";                // 401
inline constexpr std::string_view ReasonForbidden = "Forbidden";                      // 403
inline constexpr std::string_view ReasonNotFound = "Not Found";                       // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";      // 405
inline constexpr std::string_view ReasonLocked = "Locked";                            // 423
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";  // 500

// Content type
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationXml = "application/xml";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for a subset of status codes we care about.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeMultiStatus:
      return ReasonMultiStatus;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeLocked:
      return ReasonLocked;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace davgate::http
