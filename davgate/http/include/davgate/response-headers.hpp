#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace davgate {

// Ordered list of response header fields.
// Names keep the casing they were first inserted with; lookups are case-insensitive.
class ResponseHeaders {
 public:
  using Header = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Header>::const_iterator;

  ResponseHeaders() noexcept = default;

  ResponseHeaders(std::initializer_list<Header> headers);

  // Set or replace a header value ensuring at most one instance.
  // The original casing and position of the first occurrence are preserved.
  void set(std::string_view name, std::string_view value);

  // Append a header line (duplicates allowed).
  void append(std::string_view name, std::string_view value);

  // Set (replacing) every header of 'other', in its order.
  void merge(const ResponseHeaders& other);

  // Remove all occurrences of 'name'. Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  // Value of the first occurrence of 'name', or nullptr if absent.
  [[nodiscard]] const std::string* find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  bool operator==(const ResponseHeaders&) const noexcept = default;

 private:
  std::vector<Header> _headers;
};

}  // namespace davgate
