#include "davgate/compression-negotiator.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "davgate/accept-encoding.hpp"
#include "davgate/compression-config.hpp"
#include "davgate/compression-method.hpp"
#include "davgate/regex-rule.hpp"

namespace davgate {

CompressionNegotiator::CompressionNegotiator(CompressionConfig config)
    : _config(std::move(config)), _defaultRule(CompileRule("default content type", kDefaultContentTypeRule)) {
  _config.validate();
  if (!_config.contentTypeUserRule.empty()) {
    _userRule = CompileRule("compression content type", _config.contentTypeUserRule);
  }
}

bool CompressionNegotiator::canBeCompressed(std::string_view contentType) const {
  return PrefixMatch(_defaultRule, contentType) || (_userRule && PrefixMatch(*_userRule, contentType));
}

CompressionMethod CompressionNegotiator::selectMethod(std::string_view contentType,
                                                      std::optional<std::size_t> contentLength,
                                                      AcceptedEncodings acceptedEncodings) const {
  if (contentLength && *contentLength < _config.minLength) {
    return CompressionMethod::None;
  }
  if (!canBeCompressed(contentType)) {
    return CompressionMethod::None;
  }
  if (IsCompressionMethodEnabled(CompressionMethod::Brotli) && _config.enableBrotli && acceptedEncodings.br) {
    return CompressionMethod::Brotli;
  }
  if (IsCompressionMethodEnabled(CompressionMethod::Gzip) && _config.enableGzip && acceptedEncodings.gzip) {
    return CompressionMethod::Gzip;
  }
  return CompressionMethod::None;
}

}  // namespace davgate
