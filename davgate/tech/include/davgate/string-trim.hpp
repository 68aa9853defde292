#pragma once

#include <string_view>

namespace davgate {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Trim any character of 'chars' from both ends of 'sv'.
constexpr std::string_view TrimChars(std::string_view sv, std::string_view chars) noexcept {
  const auto first = sv.find_first_not_of(chars);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = sv.find_last_not_of(chars);
  return sv.substr(first, last - first + 1);
}

}  // namespace davgate
