#include "davgate/regex-rule.hpp"

#include <fmt/format.h>

#include <regex>
#include <stdexcept>
#include <string_view>

namespace davgate {

std::regex CompileRule(std::string_view ruleName, std::string_view pattern) {
  try {
    return std::regex(pattern.begin(), pattern.end(), std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& ex) {
    throw std::invalid_argument(fmt::format("Invalid {} regex '{}': {}", ruleName, pattern, ex.what()));
  }
}

bool PrefixMatch(const std::regex& rule, std::string_view value) {
  return std::regex_search(value.begin(), value.end(), rule, std::regex_constants::match_continuous);
}

}  // namespace davgate
