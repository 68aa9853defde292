#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "davgate/file.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/response-channel.hpp"
#include "davgate/response-headers.hpp"

namespace davgate {

// Writes one HTTP/1.1 response to a connected, blocking socket.
// The body is sent as is when the headers declare a Content-Length, with chunked framing otherwise.
// Zero-copy file bodies are sent with sendfile(2).
class Http1ResponseChannel final : public ResponseChannel {
 public:
  // The socket stays owned by the caller.
  explicit Http1ResponseChannel(int socketFd) noexcept : _fd(socketFd) {}

  void sendStart(http::StatusCode status, const ResponseHeaders& headers) override;

  void sendBody(std::string_view body, bool moreBody) override;

  [[nodiscard]] bool supportsZeroCopyFile() const override { return true; }

  void sendZeroCopyFile(const File& file, std::optional<std::size_t> offset, std::optional<std::size_t> count,
                        bool moreBody) override;

  // Number of body bytes written so far, framing excluded.
  [[nodiscard]] std::size_t bodyBytesWritten() const noexcept { return _bodyBytesWritten; }

  [[nodiscard]] bool finished() const noexcept { return _state == State::Ended; }

 private:
  enum class State : std::uint8_t { Opened, HeadersSent, Ended };

  void checkBodyAllowed() const;
  void writeAll(std::string_view data);
  void emitChunkHeader(std::size_t size);
  void endBody(bool moreBody);

  int _fd;
  State _state{State::Opened};
  bool _chunked{false};
  std::size_t _bodyBytesWritten{0};
};

}  // namespace davgate
