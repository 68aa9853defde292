#pragma once

#include <cstddef>

namespace davgate {

struct ResponseConfig {
  void validate() const;

  // Size of the body slices sent for in-memory content, and of the reads of the zero-copy fallback.
  std::size_t blockSize{64UL * 1024UL};
};

}  // namespace davgate
