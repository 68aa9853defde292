#include "davgate/accept-encoding.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

#include "davgate/http-constants.hpp"
#include "davgate/string-equal-ignore-case.hpp"
#include "davgate/string-trim.hpp"

namespace davgate {
namespace {

// Parse q-value within a token (portion including parameters); never throws.
double ParseQ(std::string_view params) {
  while (!params.empty()) {
    const auto nextSemi = params.find(';');
    const std::string_view param = TrimOws(params.substr(0, nextSemi));
    params = nextSemi == std::string_view::npos ? std::string_view{} : params.substr(nextSemi + 1);

    if (param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
      const std::string_view val = TrimOws(param.substr(2));
      if (val.empty()) {
        return 0.0;
      }
      double qualityValue = 0.0;
      const char* end = val.data() + val.size();
      const auto fcRes = std::from_chars(val.data(), end, qualityValue);
      if (fcRes.ec != std::errc() || fcRes.ptr != end) {
        return 0.0;  // invalid format
      }
      if (qualityValue < 0.0) {
        return 0.0;
      }
      return qualityValue > 1.0 ? 1.0 : qualityValue;
    }
  }
  return 1.0;
}

}  // namespace

AcceptedEncodings ParseAcceptEncoding(std::string_view acceptEncoding) {
  std::optional<double> gzipQ;
  std::optional<double> brQ;
  std::optional<double> wildcardQ;

  while (!acceptEncoding.empty()) {
    const auto comma = acceptEncoding.find(',');
    const std::string_view token = acceptEncoding.substr(0, comma);
    acceptEncoding = comma == std::string_view::npos ? std::string_view{} : acceptEncoding.substr(comma + 1);

    const auto semi = token.find(';');
    const std::string_view name = TrimOws(token.substr(0, semi));
    if (name.empty()) {
      continue;
    }
    const double quality = semi == std::string_view::npos ? 1.0 : ParseQ(token.substr(semi + 1));

    if (CaseInsensitiveEqual(name, http::gzip)) {
      gzipQ = quality;
    } else if (CaseInsensitiveEqual(name, http::br)) {
      brQ = quality;
    } else if (name == "*") {
      wildcardQ = quality;
    }
  }

  const double wildcard = wildcardQ.value_or(0.0);
  return AcceptedEncodings{gzipQ.value_or(wildcard) > 0.0, brQ.value_or(wildcard) > 0.0};
}

}  // namespace davgate
