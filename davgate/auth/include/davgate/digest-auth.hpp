#pragma once

#include <string>
#include <string_view>

#include "davgate/dav-user.hpp"
#include "davgate/digest-fields.hpp"
#include "davgate/random-token.hpp"

namespace davgate {

// HTTP Digest authentication (RFC 2617, MD5 with qop=auth, or the legacy form without qop).
// Nonces are not stored: any nonce that parses is accepted, they never expire and cannot be revoked
// before the secret changes at process restart.
// Immutable after construction.
class DigestAuthenticator {
 public:
  static constexpr std::string_view kPrefix = "digest ";

  struct HA1HA2 {
    std::string ha1;
    std::string ha2;
  };

  explicit DigestAuthenticator(std::string_view realm, std::string secret = RandomHexToken());

  // True if the Authorization value starts with 'digest ', case-insensitively.
  [[nodiscard]] static bool IsCredential(std::string_view authorization) noexcept;

  // Digest realm="..", qop="auth", nonce="..", opaque="..", algorithm="MD5", stale="false"
  // with a fresh nonce on each call.
  [[nodiscard]] std::string challengeString() const;

  // md5(random token + secret), hex.
  [[nodiscard]] std::string generateNonce() const;

  // HA1 = MD5(username:realm:password), HA2 = MD5(method:uri)
  [[nodiscard]] HA1HA2 buildHA1HA2(std::string_view username, std::string_view password, std::string_view method,
                                   std::string_view uri) const;

  // MD5(HA1:nonce:nc:cnonce:qop:HA2) when qop is 'auth', MD5(HA1:nonce:HA2) otherwise.
  [[nodiscard]] std::string buildRequestDigest(const DigestFields& fields, const DavUser& user,
                                               std::string_view method) const;

  // Compares in constant time the recomputed digest with 'submittedResponse'.
  [[nodiscard]] bool verifyRequestDigest(const DigestFields& fields, const DavUser& user, std::string_view method,
                                         std::string_view submittedResponse) const;

  // Value of the Authentication-Info header: rspauth="..", cnonce="..", qop=.., nc=..
  // rspauth uses the same formula as the qop=auth request digest.
  [[nodiscard]] std::string buildMutualAuthInfo(const DigestFields& fields, const DavUser& user,
                                                std::string_view method) const;

  [[nodiscard]] std::string_view realm() const noexcept { return _realm; }

  [[nodiscard]] std::string_view opaque() const noexcept { return _opaque; }

 private:
  std::string _realm;
  std::string _secret;
  std::string _opaque;
};

}  // namespace davgate
