#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "davgate/hide-file-in-dir-config.hpp"

namespace davgate {

// Decides which entries of a directory listing are hidden, depending on the client user agent.
// Thread-safe: the rules are immutable after construction, the user agent cache is guarded by a mutex.
class DirectoryEntryFilter {
 public:
  struct Rule {
    std::string userAgentPattern;
    std::string fileNamePattern;
    std::regex userAgentRegex;
    std::regex fileNameRegex;
  };

  // Built-in rules, prepended to the user ones when enabled by configuration.
  // The rule with an empty user agent pattern applies to every client.
  static constexpr std::string_view kDefaultRules[][2] = {
      {"", R"(.+\.(?:tmp|temp)$)"},
      {"WebDAVFS", R"(^(?:Thumbs\.db$|desktop\.ini$|\$RECYCLE\.BIN$))"},
      {"Microsoft-WebDAV-MiniRedir", R"(^(?:\.DS_Store$|\._))"},
  };

  // Rules of the same user agent pattern are merged by alternation, in configuration order.
  // The fallback rule (empty user agent pattern) is then merged into every other rule.
  // Throws std::invalid_argument if a pattern is not a valid regex.
  explicit DirectoryEntryFilter(const HideFileInDirConfig& config);

  // Returns false immediately if the filter is disabled. Otherwise tests 'fileName' against the rule
  // resolved for 'userAgent' with a match anchored at its first character.
  [[nodiscard]] bool shouldHide(std::string_view userAgent, std::string_view fileName) const;

  // Returns the file name rule for 'userAgent': the first rule whose user agent pattern matches it,
  // else the fallback rule, else nullptr. Resolutions are cached per user agent, absence is not.
  [[nodiscard]] const Rule* resolveRuleForUserAgent(std::string_view userAgent) const;

  [[nodiscard]] bool enabled() const noexcept { return _enable; }

  // Merged user agent specific rules, in resolution order.
  [[nodiscard]] std::span<const Rule> rules() const noexcept { return _rules; }

  [[nodiscard]] const Rule* fallbackRule() const noexcept { return _fallback ? &*_fallback : nullptr; }

  [[nodiscard]] std::size_t nbCachedUserAgents() const;

 private:
  bool _enable;
  std::vector<Rule> _rules;
  std::optional<Rule> _fallback;

  mutable std::mutex _cacheMutex;
  mutable std::unordered_map<std::string, const Rule*> _userAgentCache;
};

}  // namespace davgate
