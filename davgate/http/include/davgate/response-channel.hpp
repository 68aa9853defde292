#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "davgate/file.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/response-headers.hpp"

namespace davgate {

// Outbound side of the transport for one response.
// Protocol: sendStart exactly once, then body messages (sendBody or sendZeroCopyFile), the last one with
// moreBody == false. Implementations report I/O failures by throwing (std::system_error for sockets).
class ResponseChannel {
 public:
  virtual ~ResponseChannel() = default;

  virtual void sendStart(http::StatusCode status, const ResponseHeaders& headers) = 0;

  virtual void sendBody(std::string_view body, bool moreBody) = 0;

  // Whether sendZeroCopyFile can be used.
  [[nodiscard]] virtual bool supportsZeroCopyFile() const { return false; }

  // Sends 'count' bytes of 'file' from 'offset' (current file position when absent) without copying them
  // to user space. Sends up to the end of the file when 'count' is absent.
  // Throws std::logic_error when the channel does not support it.
  virtual void sendZeroCopyFile(const File& file, std::optional<std::size_t> offset, std::optional<std::size_t> count,
                                bool moreBody);
};

}  // namespace davgate
