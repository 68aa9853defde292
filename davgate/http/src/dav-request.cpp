#include "davgate/dav-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "davgate/accept-encoding.hpp"
#include "davgate/http-constants.hpp"

namespace davgate {

DavRequest::DavRequest(std::string method, std::string path, const HeaderList& headers)
    : _method(std::move(method)), _path(std::move(path)) {
  for (const auto &[name, value] : headers) {
    auto [it, inserted] = _headers.try_emplace(name, value);
    if (!inserted) {
      it->second.append(", ");
      it->second.append(value);
    }
  }
  if (const auto userAgent = headerValue(http::UserAgent)) {
    _userAgent.assign(*userAgent);
  }
  if (const auto acceptEncoding = headerValue(http::AcceptEncoding)) {
    _acceptedEncodings = ParseAcceptEncoding(*acceptEncoding);
  }
}

std::optional<std::string_view> DavRequest::headerValue(std::string_view name) const {
  const auto it = _headers.find(name);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace davgate
