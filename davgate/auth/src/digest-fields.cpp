#include "davgate/digest-fields.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>

#include "davgate/log.hpp"
#include "davgate/string-trim.hpp"

namespace davgate {

namespace {

constexpr std::string_view kTrimmedChars = " \"'";

}  // namespace

DigestFields::DigestFields(std::initializer_list<Field> fields) {
  for (const auto &[key, value] : fields) {
    set(key, value);
  }
}

void DigestFields::set(std::string_view key, std::string_view value) {
  auto it = std::ranges::find_if(_fields, [key](const Field& field) { return field.first == key; });
  if (it == _fields.end()) {
    _fields.emplace_back(key, value);
  } else {
    it->second.assign(value);
  }
}

const std::string* DigestFields::find(std::string_view key) const noexcept {
  auto it = std::ranges::find_if(_fields, [key](const Field& field) { return field.first == key; });
  return it == _fields.end() ? nullptr : &it->second;
}

std::string_view DigestFields::get(std::string_view key) const noexcept {
  const std::string* pValue = find(key);
  return pValue == nullptr ? std::string_view() : std::string_view(*pValue);
}

std::string_view DigestFields::firstMissingRequiredField() const noexcept {
  for (std::string_view required : kRequiredDigestFields) {
    if (!contains(required)) {
      return required;
    }
  }
  return {};
}

DigestFields ParseDigestFields(std::string_view params) {
  DigestFields fields;
  while (true) {
    const auto commaPos = params.find(',');
    const std::string_view fragment = params.substr(0, commaPos);
    const auto equalPos = fragment.find('=');
    if (equalPos == std::string_view::npos) {
      log::error("Cannot parse Digest parameter '{}', skipping it", fragment);
    } else {
      fields.set(TrimChars(fragment.substr(0, equalPos), kTrimmedChars),
                 TrimChars(fragment.substr(equalPos + 1), kTrimmedChars));
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    params.remove_prefix(commaPos + 1);
  }
  return fields;
}

std::string BuildAuthorizationString(const DigestFields& fields) {
  std::string out;
  for (const auto &[key, value] : fields) {
    if (!out.empty()) {
      out.append(", ");
    }
    out.append(key);
    out.append("=\"");
    out.append(value);
    out.push_back('"');
  }
  return out;
}

}  // namespace davgate
