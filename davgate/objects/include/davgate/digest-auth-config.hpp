#pragma once

#include <string>

namespace davgate {

struct DigestAuthConfig {
  // Throws std::invalid_argument if a rule is not a valid regex.
  void validate() const;

  // When false, Basic is the challenged scheme except for user agents matching 'enableRule'.
  // When true, Digest is the challenged scheme except for user agents matching 'disableRule'.
  // Both Basic and Digest credentials are always accepted.
  bool enable{false};

  // User-agent regex, prefix-anchored. An empty rule matches every user agent.
  std::string enableRule;
  std::string disableRule{"neon/"};
};

}  // namespace davgate
