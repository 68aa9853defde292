#pragma once

#include <cstddef>
#include <string>

#include "davgate/hex-encode.hpp"

namespace davgate {

// Returns 2 * nbRandomBytes hexadecimal chars from a cryptographically secure source.
// Throws std::runtime_error if the random generator fails.
[[nodiscard]] std::string RandomHexToken(std::size_t nbRandomBytes = 16, HexCase hexCase = HexCase::Lower);

}  // namespace davgate
