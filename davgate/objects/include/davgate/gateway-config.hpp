#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "davgate/account-config.hpp"
#include "davgate/compression-config.hpp"
#include "davgate/digest-auth-config.hpp"
#include "davgate/hide-file-in-dir-config.hpp"
#include "davgate/response-config.hpp"

namespace davgate {

// Everything the authentication and response delivery core consumes from the configuration loader.
struct GatewayConfig {
  static constexpr std::string_view kDefaultRealm = "ASGI-WebDAV";

  // Validates all members. Throws std::invalid_argument on the first invalid value.
  void validate() const;

  GatewayConfig& withAccount(std::string username, std::string password, std::vector<std::string> permissions = {},
                             bool admin = false) {
    accounts.push_back(AccountConfig{std::move(username), std::move(password), std::move(permissions), admin});
    return *this;
  }

  GatewayConfig& withDigestAuth(DigestAuthConfig config) {
    digestAuth = std::move(config);
    return *this;
  }

  GatewayConfig& withCompression(CompressionConfig config) {
    compression = std::move(config);
    return *this;
  }

  GatewayConfig& withHideFileInDir(HideFileInDirConfig config) {
    hideFileInDir = std::move(config);
    return *this;
  }

  std::string realm{kDefaultRealm};
  std::vector<AccountConfig> accounts;
  DigestAuthConfig digestAuth;
  CompressionConfig compression;
  HideFileInDirConfig hideFileInDir;
  ResponseConfig response;
};

}  // namespace davgate
