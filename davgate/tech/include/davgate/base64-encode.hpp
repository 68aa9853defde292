#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace davgate {

constexpr std::size_t B64EncodedLen(std::size_t binDataLen) { return ((binDataLen + 2U) / 3U) * 4U; }

// Standard alphabet with '=' padding (RFC 4648 section 4), as expected in 'Authorization: Basic' values.
[[nodiscard]] inline std::string B64EncodeToString(std::string_view binData) {
  static constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string ret;
  ret.reserve(B64EncodedLen(binData.size()));
  std::size_t pos = 0;
  for (; pos + 3U <= binData.size(); pos += 3U) {
    const uint32_t group = (static_cast<uint32_t>(static_cast<uint8_t>(binData[pos])) << 16U) |
                           (static_cast<uint32_t>(static_cast<uint8_t>(binData[pos + 1U])) << 8U) |
                           static_cast<uint8_t>(binData[pos + 2U]);
    ret.push_back(kAlphabet[(group >> 18U) & 0x3FU]);
    ret.push_back(kAlphabet[(group >> 12U) & 0x3FU]);
    ret.push_back(kAlphabet[(group >> 6U) & 0x3FU]);
    ret.push_back(kAlphabet[group & 0x3FU]);
  }

  const std::size_t remaining = binData.size() - pos;
  if (remaining != 0) {
    uint32_t group = static_cast<uint32_t>(static_cast<uint8_t>(binData[pos])) << 16U;
    if (remaining == 2U) {
      group |= static_cast<uint32_t>(static_cast<uint8_t>(binData[pos + 1U])) << 8U;
    }
    ret.push_back(kAlphabet[(group >> 18U) & 0x3FU]);
    ret.push_back(kAlphabet[(group >> 12U) & 0x3FU]);
    ret.push_back(remaining == 2U ? kAlphabet[(group >> 6U) & 0x3FU] : '=');
    ret.push_back('=');
  }
  return ret;
}

}  // namespace davgate
