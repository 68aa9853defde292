#pragma once

#include <regex>
#include <string_view>

namespace davgate {

// Compiles an ECMAScript regex rule coming from configuration.
// Throws std::invalid_argument naming 'ruleName' if 'pattern' is not a valid regex.
[[nodiscard]] std::regex CompileRule(std::string_view ruleName, std::string_view pattern);

// Returns true if 'rule' matches 'value' starting at position 0, not necessarily up to its end.
[[nodiscard]] bool PrefixMatch(const std::regex& rule, std::string_view value);

}  // namespace davgate
