#include "davgate/basic-auth.hpp"

#include <fmt/format.h>

#include <string_view>

#include "davgate/credential-store.hpp"
#include "davgate/dav-user.hpp"
#include "davgate/string-equal-ignore-case.hpp"

namespace davgate {

BasicAuthenticator::BasicAuthenticator(std::string_view realm, const CredentialStore& store)
    : _store(&store), _challenge(fmt::format("Basic realm=\"{}\"", realm)) {}

bool BasicAuthenticator::IsCredential(std::string_view authorization) noexcept {
  return StartsWithCaseInsensitive(authorization, kPrefix);
}

const DavUser* BasicAuthenticator::verify(std::string_view authorization) const {
  if (!IsCredential(authorization)) {
    return nullptr;
  }
  return _store->findByBasicCredential(authorization.substr(kPrefix.size()));
}

}  // namespace davgate
