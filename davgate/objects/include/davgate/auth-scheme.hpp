#pragma once

#include <cstdint>
#include <string_view>

namespace davgate {

enum class AuthScheme : std::uint8_t { Basic, Digest };

constexpr std::string_view AuthSchemeName(AuthScheme scheme) {
  return scheme == AuthScheme::Basic ? std::string_view("Basic") : std::string_view("Digest");
}

}  // namespace davgate
