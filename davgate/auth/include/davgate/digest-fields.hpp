#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace davgate {

// Parameters a Digest Authorization value must carry to be verified.
inline constexpr std::array<std::string_view, 10> kRequiredDigestFields = {
    "username", "realm", "nonce", "uri", "response", "algorithm", "opaque", "qop", "nc", "cnonce"};

// Ordered key=value parameters of a Digest Authorization or challenge value.
// Keys are case-sensitive; setting an existing key replaces its value in place.
class DigestFields {
 public:
  using Field = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Field>::const_iterator;

  DigestFields() noexcept = default;

  DigestFields(std::initializer_list<Field> fields);

  void set(std::string_view key, std::string_view value);

  // Value of 'key', or nullptr if absent.
  [[nodiscard]] const std::string* find(std::string_view key) const noexcept;

  // Value of 'key', or an empty string if absent.
  [[nodiscard]] std::string_view get(std::string_view key) const noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

  // Returns the first required field that is absent, or an empty view if all are present.
  [[nodiscard]] std::string_view firstMissingRequiredField() const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

  bool operator==(const DigestFields&) const noexcept = default;

 private:
  std::vector<Field> _fields;
};

// Parses the parameters following the 'Digest ' scheme token.
// The value is split on ',' then on the first '='. Spaces and quote characters (both " and ')
// are trimmed from keys and values. Fragments without '=' are logged and skipped.
DigestFields ParseDigestFields(std::string_view params);

// Serializes as 'k1="v1", k2="v2"'.
std::string BuildAuthorizationString(const DigestFields& fields);

}  // namespace davgate
