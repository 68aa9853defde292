#include "davgate/credential-store.hpp"

#include <string>
#include <string_view>
#include <vector>

#include "davgate/account-config.hpp"
#include "davgate/base64-encode.hpp"
#include "davgate/dav-user.hpp"
#include "davgate/log.hpp"

namespace davgate {

std::string CredentialStore::BasicCredential(std::string_view username, std::string_view password) {
  std::string plain;
  plain.reserve(username.size() + 1U + password.size());
  plain.append(username);
  plain.push_back(':');
  plain.append(password);
  return B64EncodeToString(plain);
}

CredentialStore::CredentialStore(const std::vector<AccountConfig>& accounts) {
  for (const AccountConfig& account : accounts) {
    auto [it, inserted] = _users.try_emplace(account.username);
    if (!inserted) {
      log::warn("Account '{}' is defined more than once, keeping the last definition", account.username);
      _basicCredentials.erase(BasicCredential(it->second.username, it->second.password));
    }
    it->second = DavUser{account.username, account.password, account.permissions, account.admin};
    _basicCredentials.insert_or_assign(BasicCredential(account.username, account.password), &it->second);
    log::info("Registered user '{}' admin={} with {} permission rule(s)", account.username, account.admin,
              account.permissions.size());
  }
}

const DavUser* CredentialStore::findByBasicCredential(std::string_view token) const {
  auto it = _basicCredentials.find(std::string(token));
  return it == _basicCredentials.end() ? nullptr : it->second;
}

const DavUser* CredentialStore::findByUsername(std::string_view username) const {
  auto it = _users.find(std::string(username));
  return it == _users.end() ? nullptr : &it->second;
}

}  // namespace davgate
