#include "davgate/recording-channel.hpp"

#include <unistd.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "davgate/errno-throw.hpp"
#include "davgate/file.hpp"
#include "davgate/response-headers.hpp"

namespace davgate::test {

void RecordingChannel::sendStart(http::StatusCode status, const ResponseHeaders& headers) {
  if (!_messages.empty()) {
    throw std::logic_error("response start sent twice or after body");
  }
  RecordedMessage& msg = _messages.emplace_back();
  msg.kind = RecordedMessage::Kind::Start;
  msg.status = status;
  msg.headers = headers;
}

void RecordingChannel::sendBody(std::string_view body, bool moreBody) {
  checkBodyAllowed();
  RecordedMessage& msg = _messages.emplace_back();
  msg.kind = RecordedMessage::Kind::Body;
  msg.body.assign(body);
  msg.moreBody = moreBody;
}

void RecordingChannel::sendZeroCopyFile(const File& file, std::optional<std::size_t> offset,
                                        std::optional<std::size_t> count, bool moreBody) {
  if (!_zeroCopySupported) {
    ResponseChannel::sendZeroCopyFile(file, offset, count, moreBody);
  }
  checkBodyAllowed();
  RecordedMessage& msg = _messages.emplace_back();
  msg.kind = RecordedMessage::Kind::ZeroCopyFile;
  msg.moreBody = moreBody;
  msg.offset = offset;
  msg.count = count;

  const std::size_t start = offset.value_or(0);
  const std::size_t size = file.size();
  msg.body.resize(count.value_or(start < size ? size - start : 0));
  const auto nbRead = ::pread(file.fd(), msg.body.data(), msg.body.size(), static_cast<off_t>(start));
  if (nbRead == -1) {
    ThrowErrno("pread failed for fd # {}", file.fd());
  }
  msg.body.resize(static_cast<std::size_t>(nbRead));
}

const RecordedMessage& RecordingChannel::start() const {
  if (_messages.empty() || _messages.front().kind != RecordedMessage::Kind::Start) {
    throw std::logic_error("no response start recorded");
  }
  return _messages.front();
}

std::vector<RecordedMessage> RecordingChannel::bodyMessages() const {
  if (_messages.empty()) {
    return {};
  }
  return std::vector<RecordedMessage>(_messages.begin() + 1, _messages.end());
}

std::string RecordingChannel::body() const {
  std::string out;
  for (const RecordedMessage& msg : _messages) {
    out.append(msg.body);
  }
  return out;
}

bool RecordingChannel::complete() const noexcept {
  return _messages.size() > 1 && !_messages.back().moreBody;
}

void RecordingChannel::checkBodyAllowed() const {
  if (_messages.empty()) {
    throw std::logic_error("response body sent before response start");
  }
  if (_messages.size() > 1 && !_messages.back().moreBody) {
    throw std::logic_error("response body sent after the last body message");
  }
}

}  // namespace davgate::test
