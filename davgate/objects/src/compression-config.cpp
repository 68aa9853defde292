#include "davgate/compression-config.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <utility>

#include "davgate/regex-rule.hpp"

namespace davgate {

void CompressionConfig::validate() const {
  if (encoderChunkSize == 0) {
    throw std::invalid_argument("Invalid encoder chunk size");
  }
  switch (level) {
    case CompressionLevel::Fast:
    case CompressionLevel::Default:
    case CompressionLevel::Best:
      break;
    default:
      throw std::invalid_argument(fmt::format("Invalid compression level {}", static_cast<int>(level)));
  }
  if (!contentTypeUserRule.empty()) {
    (void)CompileRule("compression content type", contentTypeUserRule);
  }
}

int GzipLevel(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fast:
      return 1;
    case CompressionLevel::Default:
      return 4;
    case CompressionLevel::Best:
      return 9;
    default:
      std::unreachable();
  }
}

int BrotliQuality(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fast:
      return 1;
    case CompressionLevel::Default:
      return 4;
    case CompressionLevel::Best:
      return 11;
    default:
      std::unreachable();
  }
}

}  // namespace davgate
