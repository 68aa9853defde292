#pragma once

#include <cstdint>

namespace davgate::http {

using StatusCode = int16_t;

// Success, including the WebDAV multi-status answer of PROPFIND and PROPPATCH.
inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeNoContent = 204;
inline constexpr StatusCode StatusCodePartialContent = 206;
inline constexpr StatusCode StatusCodeMultiStatus = 207;

// Client errors. 423 is emitted for resources held by a WebDAV lock.
inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeLocked = 423;

inline constexpr StatusCode StatusCodeInternalServerError = 500;

}  // namespace davgate::http
