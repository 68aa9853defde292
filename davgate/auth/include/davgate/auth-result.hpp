#pragma once

#include <optional>
#include <string>

#include "davgate/auth-scheme.hpp"
#include "davgate/dav-user.hpp"

namespace davgate {

// Outcome of the authentication of one request.
struct AuthResult {
  [[nodiscard]] bool authenticated() const noexcept { return user != nullptr; }

  // Owned by the CredentialStore. nullptr on failure.
  const DavUser* user{nullptr};
  // Empty on success. Meant for logs, the client only sees a generic message.
  std::string failureReason;
  // Scheme of the Authorization header, when recognized.
  std::optional<AuthScheme> scheme;
  // Authentication-Info value for successful Digest requests, empty otherwise.
  std::string mutualAuthInfo;
};

}  // namespace davgate
