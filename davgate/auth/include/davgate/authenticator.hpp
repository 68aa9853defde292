#pragma once

#include <regex>
#include <string_view>

#include "davgate/auth-result.hpp"
#include "davgate/basic-auth.hpp"
#include "davgate/credential-store.hpp"
#include "davgate/dav-request.hpp"
#include "davgate/dav-response.hpp"
#include "davgate/digest-auth.hpp"
#include "davgate/digest-auth-config.hpp"
#include "davgate/gateway-config.hpp"

namespace davgate {

// Verifies the Authorization header of requests against the configured accounts, and builds
// the 401 challenges. Immutable after construction, one instance serves all concurrent requests.
class Authenticator {
 public:
  static constexpr std::string_view kMissingHeader = "missing header: authorization";
  static constexpr std::string_view kNoPermission = "no permission";
  static constexpr std::string_view kUnknownMethod = "unknown authentication method";

  // Throws std::invalid_argument if the configuration is invalid.
  explicit Authenticator(const GatewayConfig& config);

  Authenticator(const Authenticator&) = delete;
  Authenticator(Authenticator&&) = delete;
  Authenticator& operator=(const Authenticator&) = delete;
  Authenticator& operator=(Authenticator&&) = delete;

  ~Authenticator() = default;

  // Never throws on malformed client input. On success, records the scheme and the mutual
  // authentication info in 'request' for the response to come.
  AuthResult authenticate(DavRequest& request) const;

  // 401 response carrying an HTML page with 'message' and a WWW-Authenticate challenge.
  // The scheme is chosen from the request user agent and the Digest rules.
  [[nodiscard]] DavResponse buildChallengeResponse(const DavRequest& request, std::string_view message) const;

  // True if the 401 for this user agent challenges with Digest rather than Basic.
  [[nodiscard]] bool challengeWithDigest(std::string_view userAgent) const;

  [[nodiscard]] const CredentialStore& credentialStore() const noexcept { return _store; }

  [[nodiscard]] const BasicAuthenticator& basic() const noexcept { return _basic; }

  [[nodiscard]] const DigestAuthenticator& digest() const noexcept { return _digest; }

 private:
  AuthResult authenticateDigest(DavRequest& request, std::string_view authorization) const;

  CredentialStore _store;
  BasicAuthenticator _basic;
  DigestAuthenticator _digest;
  bool _digestEnabled;
  std::regex _digestEnableRule;
  std::regex _digestDisableRule;
};

}  // namespace davgate
