#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

namespace davgate {

// ASCII only lower casing, locale independent.
constexpr char AsciiToLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

// Header names and authorization schemes are compared without regard to ASCII case.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return std::ranges::equal(lhs, rhs, [](char lc, char rc) { return AsciiToLower(lc) == AsciiToLower(rc); });
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  // FNV-1a on the lower cased bytes.
  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 14695981039346656037ULL;
    for (char ch : str) {
      hash ^= static_cast<unsigned char>(AsciiToLower(ch));
      hash *= 1099511628211ULL;
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace davgate
