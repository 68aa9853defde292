#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace davgate {

enum class HexCase : bool { Lower, Upper };

// Hexadecimal representation of 'bytes', two chars per byte, most significant nibble first.
[[nodiscard]] inline std::string HexEncode(std::span<const unsigned char> bytes, HexCase hexCase = HexCase::Lower) {
  const char* hexits = hexCase == HexCase::Lower ? "0123456789abcdef" : "0123456789ABCDEF";
  std::string ret;
  ret.resize_and_overwrite(2UL * bytes.size(), [bytes, hexits](char* out, std::size_t n) {
    for (unsigned char byte : bytes) {
      *out++ = hexits[byte >> 4U];
      *out++ = hexits[byte & 0x0FU];
    }
    return n;
  });
  return ret;
}

}  // namespace davgate
