#pragma once

#include <string>
#include <vector>

namespace davgate {

// An authenticated principal. Immutable once loaded, owned by the CredentialStore.
struct DavUser {
  std::string username;
  std::string password;
  std::vector<std::string> permissions;
  bool admin{false};
};

}  // namespace davgate
