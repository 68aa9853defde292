#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string_view>

#include "davgate/accept-encoding.hpp"
#include "davgate/compression-config.hpp"
#include "davgate/compression-method.hpp"

namespace davgate {

// Decides once per response which codec, if any, is applied to its body.
// Immutable after construction, safe to share between concurrent requests.
class CompressionNegotiator {
 public:
  // Content types always eligible for compression.
  static constexpr std::string_view kDefaultContentTypeRule = "^application/(?:javascript|json|xml)$|^text/";

  // Throws std::invalid_argument if the configuration is invalid.
  explicit CompressionNegotiator(CompressionConfig config);

  // Rules, in order:
  //  - a known length below the configured minimum is never compressed
  //  - a content type matching the default or the user rule uses brotli if compiled, enabled and accepted,
  //    else gzip if compiled, enabled and accepted
  //  - everything else is not compressed
  [[nodiscard]] CompressionMethod selectMethod(std::string_view contentType, std::optional<std::size_t> contentLength,
                                               AcceptedEncodings acceptedEncodings) const;

  [[nodiscard]] bool canBeCompressed(std::string_view contentType) const;

  [[nodiscard]] const CompressionConfig& config() const noexcept { return _config; }

 private:
  CompressionConfig _config;
  std::regex _defaultRule;
  std::optional<std::regex> _userRule;
};

}  // namespace davgate
