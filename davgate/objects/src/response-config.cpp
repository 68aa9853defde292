#include "davgate/response-config.hpp"

#include <stdexcept>

namespace davgate {

void ResponseConfig::validate() const {
  if (blockSize == 0) {
    throw std::invalid_argument("Response block size cannot be 0");
  }
}

}  // namespace davgate
