#include "davgate/gateway-config.hpp"

#include <stdexcept>

namespace davgate {

void GatewayConfig::validate() const {
  if (realm.empty()) {
    throw std::invalid_argument("Realm cannot be empty");
  }
  if (realm.find('"') != std::string::npos) {
    throw std::invalid_argument("Realm cannot contain a double quote");
  }
  for (const AccountConfig& account : accounts) {
    account.validate();
  }
  digestAuth.validate();
  compression.validate();
  hideFileInDir.validate();
  response.validate();
}

}  // namespace davgate
