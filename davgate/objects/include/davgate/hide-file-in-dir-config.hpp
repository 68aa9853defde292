#pragma once

#include <string>
#include <utility>
#include <vector>

namespace davgate {

struct HideFileInDirConfig {
  // Throws std::invalid_argument if a rule is not a valid regex.
  void validate() const;

  HideFileInDirConfig& withUserRule(std::string userAgentRule, std::string fileNameRule) {
    userRules.emplace_back(std::move(userAgentRule), std::move(fileNameRule));
    return *this;
  }

  bool enable{true};

  // Prepend the built-in rules (temporary files, Windows and macOS metadata files).
  bool enableDefaultRules{true};

  // Ordered (userAgentRegex, fileNameRegex) pairs. An empty user agent regex is the fallback rule,
  // applied to every client in addition to the specific ones.
  std::vector<std::pair<std::string, std::string>> userRules;
};

}  // namespace davgate
