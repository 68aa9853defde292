#include "davgate/account-config.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "davgate/log.hpp"

namespace davgate {

void AccountConfig::validate() const {
  if (username.empty()) {
    throw std::invalid_argument("Account username cannot be empty");
  }
  // user-pass separator of Basic credentials
  if (username.find(':') != std::string::npos) {
    throw std::invalid_argument(fmt::format("Account username '{}' cannot contain ':'", username));
  }
  // Digest parameters are split on ',' and unquoted, such a user can only log in with Basic
  if (username.find_first_of("\",") != std::string::npos) {
    log::warn("Account username '{}' contains quotes or commas, Digest authentication will fail for it", username);
  }
}

}  // namespace davgate
