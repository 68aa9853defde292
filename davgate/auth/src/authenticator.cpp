#include "davgate/authenticator.hpp"

#include <fmt/format.h>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "davgate/auth-result.hpp"
#include "davgate/auth-scheme.hpp"
#include "davgate/dav-request.hpp"
#include "davgate/dav-response.hpp"
#include "davgate/dav-user.hpp"
#include "davgate/digest-fields.hpp"
#include "davgate/gateway-config.hpp"
#include "davgate/http-constants.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/log.hpp"
#include "davgate/regex-rule.hpp"

namespace davgate {

namespace {

constexpr std::string_view k401Template = R"(<!DOCTYPE html>
<html>
  <head>
    <meta charset="UTF-8" />
    <title>Error</title>
  </head>
  <body>
    <h1>401 Unauthorized. {}</h1>
  </body>
</html>)";

AuthResult Failure(std::string_view reason, std::optional<AuthScheme> scheme = std::nullopt) {
  AuthResult result;
  result.failureReason = reason;
  result.scheme = scheme;
  return result;
}

const GatewayConfig& Validated(const GatewayConfig& config) {
  config.validate();
  return config;
}

}  // namespace

Authenticator::Authenticator(const GatewayConfig& config)
    : _store(Validated(config).accounts),
      _basic(config.realm, _store),
      _digest(config.realm),
      _digestEnabled(config.digestAuth.enable),
      _digestEnableRule(CompileRule("digest enable", config.digestAuth.enableRule)),
      _digestDisableRule(CompileRule("digest disable", config.digestAuth.disableRule)) {
  log::info("Authenticator ready for realm '{}' with {} user(s), digest challenge {}", config.realm, _store.size(),
            _digestEnabled ? "enabled" : "disabled");
}

AuthResult Authenticator::authenticate(DavRequest& request) const {
  const auto authorization = request.headerValue(http::Authorization);
  if (!authorization) {
    return Failure(kMissingHeader);
  }

  if (BasicAuthenticator::IsCredential(*authorization)) {
    request.authorizationMethod = AuthScheme::Basic;
    const DavUser* user = _basic.verify(*authorization);
    if (user == nullptr) {
      return Failure(kNoPermission, AuthScheme::Basic);
    }
    AuthResult result;
    result.user = user;
    result.scheme = AuthScheme::Basic;
    return result;
  }

  if (DigestAuthenticator::IsCredential(*authorization)) {
    request.authorizationMethod = AuthScheme::Digest;
    return authenticateDigest(request, *authorization);
  }

  return Failure(kUnknownMethod);
}

AuthResult Authenticator::authenticateDigest(DavRequest& request, std::string_view authorization) const {
  const DigestFields fields = ParseDigestFields(authorization.substr(DigestAuthenticator::kPrefix.size()));
  if (const auto missing = fields.firstMissingRequiredField(); !missing.empty()) {
    log::debug("Digest authorization without '{}' parameter", missing);
    return Failure(kNoPermission, AuthScheme::Digest);
  }

  const DavUser* user = _store.findByUsername(fields.get("username"));
  if (user == nullptr) {
    return Failure(kNoPermission, AuthScheme::Digest);
  }

  const std::string_view submitted = fields.get("response");
  if (!_digest.verifyRequestDigest(fields, *user, request.method(), submitted)) {
    log::debug("expected request digest:{}, but request digest:{}",
               _digest.buildRequestDigest(fields, *user, request.method()), submitted);
    return Failure(kNoPermission, AuthScheme::Digest);
  }

  AuthResult result;
  result.user = user;
  result.scheme = AuthScheme::Digest;
  result.mutualAuthInfo = _digest.buildMutualAuthInfo(fields, *user, request.method());
  request.authenticationInfo = result.mutualAuthInfo;
  return result;
}

bool Authenticator::challengeWithDigest(std::string_view userAgent) const {
  if (_digestEnabled) {
    return !PrefixMatch(_digestDisableRule, userAgent);
  }
  return PrefixMatch(_digestEnableRule, userAgent);
}

DavResponse Authenticator::buildChallengeResponse(const DavRequest& request, std::string_view message) const {
  std::string challenge;
  if (challengeWithDigest(request.userAgent())) {
    challenge = _digest.challengeString();
    log::debug("response Digest auth challenge");
  } else {
    challenge = _basic.challengeString();
    log::debug("response Basic auth challenge");
  }
  return DavResponse(http::StatusCodeUnauthorized, ResponseHeaders{{std::string(http::WWWAuthenticate), challenge}},
                     ResponseType::Html, fmt::format(k401Template, message));
}

}  // namespace davgate
