#include "davgate/random-token.hpp"

#include <openssl/rand.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "davgate/hex-encode.hpp"

namespace davgate {

std::string RandomHexToken(std::size_t nbRandomBytes, HexCase hexCase) {
  std::vector<unsigned char> data(nbRandomBytes);
  if (::RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating random token");
  }
  return HexEncode(data, hexCase);
}

}  // namespace davgate
