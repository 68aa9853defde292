#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "davgate/file.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/response-channel.hpp"
#include "davgate/response-headers.hpp"

namespace davgate::test {

struct RecordedMessage {
  enum class Kind : std::uint8_t { Start, Body, ZeroCopyFile };

  Kind kind{Kind::Body};
  http::StatusCode status{0};
  ResponseHeaders headers;
  // Body bytes. For zero-copy messages, the bytes of the file designated by the message.
  std::string body;
  bool moreBody{false};
  std::optional<std::size_t> offset;
  std::optional<std::size_t> count;
};

// ResponseChannel keeping every emitted message in memory, and checking the message protocol.
class RecordingChannel : public ResponseChannel {
 public:
  explicit RecordingChannel(bool zeroCopySupported = false) : _zeroCopySupported(zeroCopySupported) {}

  void sendStart(http::StatusCode status, const ResponseHeaders& headers) override;

  void sendBody(std::string_view body, bool moreBody) override;

  [[nodiscard]] bool supportsZeroCopyFile() const override { return _zeroCopySupported; }

  void sendZeroCopyFile(const File& file, std::optional<std::size_t> offset, std::optional<std::size_t> count,
                        bool moreBody) override;

  [[nodiscard]] const std::vector<RecordedMessage>& messages() const noexcept { return _messages; }

  // The first message, which must be a start one.
  [[nodiscard]] const RecordedMessage& start() const;

  // Messages following the start one.
  [[nodiscard]] std::vector<RecordedMessage> bodyMessages() const;

  // Concatenation of all body bytes.
  [[nodiscard]] std::string body() const;

  // True when the last message closes the body.
  [[nodiscard]] bool complete() const noexcept;

 private:
  void checkBodyAllowed() const;

  std::vector<RecordedMessage> _messages;
  bool _zeroCopySupported;
};

}  // namespace davgate::test
