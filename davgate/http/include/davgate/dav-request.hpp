#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "davgate/accept-encoding.hpp"
#include "davgate/auth-scheme.hpp"
#include "davgate/string-equal-ignore-case.hpp"

namespace davgate {

// Parsed request data handed over by the transport layer, plus the authentication outcome
// that downstream handling needs when building the response.
class DavRequest {
 public:
  using HeaderList = std::vector<std::pair<std::string, std::string>>;

  // Repeated header names are combined into a single comma separated value (RFC 9110 section 5.3).
  DavRequest(std::string method, std::string path, const HeaderList& headers);

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Case-insensitive header lookup.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const;

  // Empty if the client did not send a User-Agent header.
  [[nodiscard]] std::string_view userAgent() const noexcept { return _userAgent; }

  [[nodiscard]] AcceptedEncodings acceptedEncodings() const noexcept { return _acceptedEncodings; }

  // Scheme of the verified credentials, set by the Authenticator.
  std::optional<AuthScheme> authorizationMethod;

  // Digest mutual authentication info, to be sent back as Authentication-Info. Empty if none.
  std::string authenticationInfo;

 private:
  using HeadersMap = std::unordered_map<std::string, std::string, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc>;

  std::string _method;
  std::string _path;
  HeadersMap _headers;
  std::string _userAgent;
  AcceptedEncodings _acceptedEncodings;
};

}  // namespace davgate
