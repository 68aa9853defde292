#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace davgate {

// Lower case hexadecimal MD5 digest of 'data' (32 chars).
// Throws std::runtime_error if the digest cannot be computed.
[[nodiscard]] std::string Md5Hex(std::string_view data);

// MD5 of the given parts joined with ':', as used by HTTP Digest (RFC 2617) for HA1, HA2 and responses.
[[nodiscard]] std::string Md5HexJoined(std::initializer_list<std::string_view> parts);

}  // namespace davgate
