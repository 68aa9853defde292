#include "davgate/digest-auth.hpp"

#include <fmt/format.h>
#include <openssl/crypto.h>

#include <string>
#include <string_view>
#include <utility>

#include "davgate/dav-user.hpp"
#include "davgate/digest-fields.hpp"
#include "davgate/md5.hpp"
#include "davgate/random-token.hpp"
#include "davgate/string-equal-ignore-case.hpp"

namespace davgate {

namespace {

constexpr std::string_view kQopAuth = "auth";

}  // namespace

DigestAuthenticator::DigestAuthenticator(std::string_view realm, std::string secret)
    : _realm(realm), _secret(std::move(secret)), _opaque(RandomHexToken(16, HexCase::Upper)) {}

bool DigestAuthenticator::IsCredential(std::string_view authorization) noexcept {
  return StartsWithCaseInsensitive(authorization, kPrefix);
}

std::string DigestAuthenticator::generateNonce() const {
  std::string seed = RandomHexToken();
  seed.append(_secret);
  return Md5Hex(seed);
}

std::string DigestAuthenticator::challengeString() const {
  const DigestFields challenge{{"realm", _realm},   {"qop", std::string(kQopAuth)}, {"nonce", generateNonce()},
                               {"opaque", _opaque}, {"algorithm", "MD5"},           {"stale", "false"}};
  return fmt::format("Digest {}", BuildAuthorizationString(challenge));
}

DigestAuthenticator::HA1HA2 DigestAuthenticator::buildHA1HA2(std::string_view username, std::string_view password,
                                                             std::string_view method, std::string_view uri) const {
  return {Md5HexJoined({username, _realm, password}), Md5HexJoined({method, uri})};
}

std::string DigestAuthenticator::buildRequestDigest(const DigestFields& fields, const DavUser& user,
                                                    std::string_view method) const {
  const auto [ha1, ha2] = buildHA1HA2(user.username, user.password, method, fields.get("uri"));
  if (fields.get("qop") == kQopAuth) {
    return Md5HexJoined({ha1, fields.get("nonce"), fields.get("nc"), fields.get("cnonce"), kQopAuth, ha2});
  }
  return Md5HexJoined({ha1, fields.get("nonce"), ha2});
}

bool DigestAuthenticator::verifyRequestDigest(const DigestFields& fields, const DavUser& user, std::string_view method,
                                              std::string_view submittedResponse) const {
  const std::string expected = buildRequestDigest(fields, user, method);
  return expected.size() == submittedResponse.size() &&
         CRYPTO_memcmp(expected.data(), submittedResponse.data(), expected.size()) == 0;
}

std::string DigestAuthenticator::buildMutualAuthInfo(const DigestFields& fields, const DavUser& user,
                                                     std::string_view method) const {
  const auto [ha1, ha2] = buildHA1HA2(user.username, user.password, method, fields.get("uri"));
  const std::string rspauth = Md5HexJoined(
      {ha1, fields.get("nonce"), fields.get("nc"), fields.get("cnonce"), fields.get("qop"), ha2});
  return fmt::format(R"(rspauth="{}", cnonce="{}", qop={}, nc={})", rspauth, fields.get("cnonce"), fields.get("qop"),
                     fields.get("nc"));
}

}  // namespace davgate
