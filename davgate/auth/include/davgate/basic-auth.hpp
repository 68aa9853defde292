#pragma once

#include <string>
#include <string_view>

#include "davgate/credential-store.hpp"
#include "davgate/dav-user.hpp"

namespace davgate {

// HTTP Basic authentication (RFC 7617).
class BasicAuthenticator {
 public:
  static constexpr std::string_view kPrefix = "basic ";

  // 'store' must outlive this object.
  BasicAuthenticator(std::string_view realm, const CredentialStore& store);

  // True if the Authorization value starts with 'basic ', case-insensitively.
  [[nodiscard]] static bool IsCredential(std::string_view authorization) noexcept;

  // Basic realm="<realm>"
  [[nodiscard]] const std::string& challengeString() const noexcept { return _challenge; }

  // Looks up the token following the scheme prefix. nullptr if unknown, never throws on bad input.
  [[nodiscard]] const DavUser* verify(std::string_view authorization) const;

 private:
  const CredentialStore* _store;
  std::string _challenge;
};

}  // namespace davgate
