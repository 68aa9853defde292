#include "davgate/md5.hpp"

#include <openssl/evp.h>

#include <array>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "davgate/hex-encode.hpp"

namespace davgate {

std::string Md5Hex(std::string_view data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
  unsigned int digestLen = 0;
  if (::EVP_Digest(data.data(), data.size(), digest.data(), &digestLen, ::EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest(MD5) failed");
  }
  return HexEncode(std::span<const unsigned char>(digest.data(), digestLen));
}

std::string Md5HexJoined(std::initializer_list<std::string_view> parts) {
  std::size_t totalSize = parts.size() == 0 ? 0 : parts.size() - 1U;
  for (std::string_view part : parts) {
    totalSize += part.size();
  }
  std::string joined;
  joined.reserve(totalSize);
  for (auto it = parts.begin(); it != parts.end(); ++it) {
    if (it != parts.begin()) {
      joined.push_back(':');
    }
    joined.append(*it);
  }
  return Md5Hex(joined);
}

}  // namespace davgate
