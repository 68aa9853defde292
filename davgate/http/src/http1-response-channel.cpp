#include "davgate/http1-response-channel.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "davgate/errno-throw.hpp"
#include "davgate/file.hpp"
#include "davgate/http-constants.hpp"
#include "davgate/log.hpp"
#include "davgate/response-headers.hpp"
#include "davgate/sendfile.hpp"

namespace davgate {

void Http1ResponseChannel::sendStart(http::StatusCode status, const ResponseHeaders& headers) {
  if (_state != State::Opened) {
    throw std::logic_error("response start already sent");
  }
  _chunked = !headers.contains(http::ContentLength);

  std::string head;
  head.append(http::HTTP11Sv);
  head.push_back(' ');
  head.append(std::to_string(status));
  head.push_back(' ');
  head.append(http::ReasonPhraseFor(status));
  head.append(http::CRLF);
  for (const auto &[name, value] : headers) {
    head.append(name);
    head.append(http::HeaderSep);
    head.append(value);
    head.append(http::CRLF);
  }
  if (_chunked) {
    head.append(http::TransferEncoding);
    head.append(http::HeaderSep);
    head.append(http::chunked);
    head.append(http::CRLF);
  }
  head.append(http::CRLF);

  writeAll(head);
  _state = State::HeadersSent;
  log::trace("HTTP/1.1: headers sent fd # {} status={} chunked={}", _fd, status, _chunked);
}

void Http1ResponseChannel::sendBody(std::string_view body, bool moreBody) {
  checkBodyAllowed();
  if (!body.empty()) {
    if (_chunked) {
      emitChunkHeader(body.size());
    }
    writeAll(body);
    if (_chunked) {
      writeAll(http::CRLF);
    }
    _bodyBytesWritten += body.size();
  }
  endBody(moreBody);
}

void Http1ResponseChannel::sendZeroCopyFile(const File& file, std::optional<std::size_t> offset,
                                            std::optional<std::size_t> count, bool moreBody) {
  checkBodyAllowed();

  off_t pos = offset ? static_cast<off_t>(*offset) : ::lseek(file.fd(), 0, SEEK_CUR);
  if (pos == static_cast<off_t>(-1)) {
    ThrowErrno("lseek failed for fd # {}", file.fd());
  }
  const std::size_t fileSize = file.size();
  const auto start = static_cast<std::size_t>(pos);
  std::size_t remaining = count.value_or(start < fileSize ? fileSize - start : 0);

  if (remaining != 0) {
    if (_chunked) {
      emitChunkHeader(remaining);
    }
    while (remaining != 0) {
      const auto sent = Sendfile(_fd, file.fd(), pos, remaining);
      if (sent == -1) {
        if (errno == EINTR) {
          continue;
        }
        ThrowErrno("sendfile failed from fd # {} to fd # {}", file.fd(), _fd);
      }
      if (sent == 0) {
        throw std::runtime_error("sendfile: unexpected end of file");
      }
      remaining -= static_cast<std::size_t>(sent);
      _bodyBytesWritten += static_cast<std::size_t>(sent);
    }
    if (_chunked) {
      writeAll(http::CRLF);
    }
  }
  endBody(moreBody);
}

void Http1ResponseChannel::checkBodyAllowed() const {
  if (_state == State::Opened) {
    throw std::logic_error("response body sent before response start");
  }
  if (_state == State::Ended) {
    throw std::logic_error("response body sent after the last body message");
  }
}

void Http1ResponseChannel::endBody(bool moreBody) {
  if (moreBody) {
    return;
  }
  if (_chunked) {
    static constexpr std::string_view kLastChunk = "0\r\n\r\n";
    writeAll(kLastChunk);
  }
  _state = State::Ended;
  log::debug("HTTP/1.1: response ended fd # {} bodyBytes={} chunked={}", _fd, _bodyBytesWritten, _chunked);
}

void Http1ResponseChannel::emitChunkHeader(std::size_t size) {
  // enough for 64-bit length in hex + CRLF
  static constexpr std::size_t kMaxHexLen = 2UL * sizeof(uint64_t);
  char buf[kMaxHexLen + http::CRLF.size()];
  auto res = std::to_chars(buf, buf + kMaxHexLen, static_cast<uint64_t>(size), 16);
  res.ptr[0] = '\r';
  res.ptr[1] = '\n';
  writeAll(std::string_view(buf, static_cast<std::size_t>(res.ptr + http::CRLF.size() - buf)));
}

void Http1ResponseChannel::writeAll(std::string_view data) {
  while (!data.empty()) {
    const auto written = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("send failed for fd # {}", _fd);
    }
    data.remove_prefix(static_cast<std::size_t>(written));
  }
}

}  // namespace davgate
