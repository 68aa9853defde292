#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "davgate/account-config.hpp"
#include "davgate/dav-user.hpp"

namespace davgate {

// Users known by the gateway, indexed by username and by Basic credential token.
// Built once at startup, read-only afterwards: concurrent lookups need no locking.
class CredentialStore {
 public:
  CredentialStore() noexcept = default;

  // When two accounts share a username, or produce the same Basic token, the last one wins.
  explicit CredentialStore(const std::vector<AccountConfig>& accounts);

  // Not copyable nor movable: the Basic token index points into the user map.
  CredentialStore(const CredentialStore&) = delete;
  CredentialStore(CredentialStore&&) = delete;
  CredentialStore& operator=(const CredentialStore&) = delete;
  CredentialStore& operator=(CredentialStore&&) = delete;

  ~CredentialStore() = default;

  // 'token' is the base64 form of 'username:password', as sent after 'Basic '.
  [[nodiscard]] const DavUser* findByBasicCredential(std::string_view token) const;

  [[nodiscard]] const DavUser* findByUsername(std::string_view username) const;

  [[nodiscard]] std::size_t size() const noexcept { return _users.size(); }

  // base64(username:password)
  static std::string BasicCredential(std::string_view username, std::string_view password);

 private:
  std::unordered_map<std::string, DavUser> _users;
  std::unordered_map<std::string, const DavUser*> _basicCredentials;
};

}  // namespace davgate
