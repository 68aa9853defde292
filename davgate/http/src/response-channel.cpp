#include "davgate/response-channel.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>

#include "davgate/file.hpp"

namespace davgate {

void ResponseChannel::sendZeroCopyFile([[maybe_unused]] const File& file,
                                       [[maybe_unused]] std::optional<std::size_t> offset,
                                       [[maybe_unused]] std::optional<std::size_t> count,
                                       [[maybe_unused]] bool moreBody) {
  throw std::logic_error("zero-copy file transmission is not supported by this channel");
}

}  // namespace davgate
