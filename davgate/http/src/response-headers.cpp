#include "davgate/response-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>

#include "davgate/string-equal-ignore-case.hpp"

namespace davgate {

namespace {

struct HasName {
  bool operator()(const ResponseHeaders::Header& header) const noexcept {
    return CaseInsensitiveEqual(header.first, name);
  }

  std::string_view name;
};

}  // namespace

ResponseHeaders::ResponseHeaders(std::initializer_list<Header> headers) {
  for (const auto &[name, value] : headers) {
    set(name, value);
  }
}

void ResponseHeaders::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers, HasName{name});
  if (it == _headers.end()) {
    _headers.emplace_back(name, value);
    return;
  }
  it->second.assign(value);
  // drop later duplicates to keep a single instance
  auto dupIt = std::remove_if(std::next(it), _headers.end(), HasName{name});
  _headers.erase(dupIt, _headers.end());
}

void ResponseHeaders::append(std::string_view name, std::string_view value) { _headers.emplace_back(name, value); }

void ResponseHeaders::merge(const ResponseHeaders& other) {
  for (const auto &[name, value] : other) {
    set(name, value);
  }
}

std::size_t ResponseHeaders::erase(std::string_view name) {
  return std::erase_if(_headers, HasName{name});
}

const std::string* ResponseHeaders::find(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, HasName{name});
  return it == _headers.end() ? nullptr : &it->second;
}

}  // namespace davgate
