#pragma once

#include <string_view>

namespace davgate {

// Content codings a client declared acceptable, among the ones this server can produce.
struct AcceptedEncodings {
  bool gzip{false};
  bool br{false};

  bool operator==(const AcceptedEncodings&) const noexcept = default;
};

// Parse an Accept-Encoding header per RFC 9110 section 12.5.3.
// Rules implemented:
//  - Split on commas; each token may have optional parameters separated by ';'
//  - Extract q parameter (q=0..1, default 1.0). Invalid q -> treated as 0.
//  - Case-insensitive exact token matching.
//  - Encodings with q=0 are not acceptable.
//  - Wildcard '*' applies its q to any coding not explicitly listed.
[[nodiscard]] AcceptedEncodings ParseAcceptEncoding(std::string_view acceptEncoding);

}  // namespace davgate
