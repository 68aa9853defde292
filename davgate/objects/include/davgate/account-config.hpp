#pragma once

#include <string>
#include <vector>

namespace davgate {

struct AccountConfig {
  // Throws std::invalid_argument if the account cannot be used for Basic or Digest authentication.
  void validate() const;

  std::string username;
  std::string password;
  // Permission rules, interpreted by the resource layer.
  std::vector<std::string> permissions;
  bool admin{false};
};

}  // namespace davgate
