#include "davgate/directory-entry-filter.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "davgate/hide-file-in-dir-config.hpp"
#include "davgate/log.hpp"
#include "davgate/regex-rule.hpp"

namespace davgate {

namespace {

using RawRules = std::vector<std::pair<std::string, std::string>>;

void MergeRule(RawRules& rules, std::string_view userAgentPattern, std::string_view fileNamePattern) {
  auto it =
      std::ranges::find_if(rules, [userAgentPattern](const auto& rule) { return rule.first == userAgentPattern; });
  if (it == rules.end()) {
    rules.emplace_back(userAgentPattern, fileNamePattern);
  } else {
    it->second.push_back('|');
    it->second.append(fileNamePattern);
  }
}

DirectoryEntryFilter::Rule MakeRule(std::string userAgentPattern, std::string fileNamePattern) {
  DirectoryEntryFilter::Rule rule;
  if (!userAgentPattern.empty()) {
    rule.userAgentRegex = CompileRule("hide file user agent", userAgentPattern);
  }
  rule.fileNameRegex = CompileRule("hide file name", fileNamePattern);
  rule.userAgentPattern = std::move(userAgentPattern);
  rule.fileNamePattern = std::move(fileNamePattern);
  return rule;
}

}  // namespace

DirectoryEntryFilter::DirectoryEntryFilter(const HideFileInDirConfig& config) : _enable(config.enable) {
  if (!_enable) {
    return;
  }

  RawRules rawRules;
  if (config.enableDefaultRules) {
    for (const auto &[userAgentPattern, fileNamePattern] : kDefaultRules) {
      MergeRule(rawRules, userAgentPattern, fileNamePattern);
    }
  }
  for (const auto &[userAgentPattern, fileNamePattern] : config.userRules) {
    MergeRule(rawRules, userAgentPattern, fileNamePattern);
  }

  auto fallbackIt = std::ranges::find_if(rawRules, [](const auto& rule) { return rule.first.empty(); });
  std::string fallbackPattern;
  if (fallbackIt != rawRules.end()) {
    fallbackPattern = std::move(fallbackIt->second);
    rawRules.erase(fallbackIt);
    _fallback = MakeRule(std::string(), fallbackPattern);
  }

  _rules.reserve(rawRules.size());
  for (auto &[userAgentPattern, fileNamePattern] : rawRules) {
    if (_fallback) {
      fileNamePattern = fallbackPattern + '|' + fileNamePattern;
    }
    _rules.push_back(MakeRule(std::move(userAgentPattern), std::move(fileNamePattern)));
  }
  log::debug("Directory entry filter initialized with {} user agent rules, fallback rule: '{}'", _rules.size(),
             fallbackPattern);
}

const DirectoryEntryFilter::Rule* DirectoryEntryFilter::resolveRuleForUserAgent(std::string_view userAgent) const {
  const std::string userAgentKey(userAgent);
  {
    std::lock_guard<std::mutex> lock(_cacheMutex);
    if (auto it = _userAgentCache.find(userAgentKey); it != _userAgentCache.end()) {
      return it->second;
    }
  }

  const Rule* pRule = nullptr;
  auto ruleIt = std::ranges::find_if(
      _rules, [userAgent](const Rule& rule) { return PrefixMatch(rule.userAgentRegex, userAgent); });
  if (ruleIt != _rules.end()) {
    pRule = &*ruleIt;
  } else if (_fallback) {
    pRule = &*_fallback;
  }
  if (pRule != nullptr) {
    std::lock_guard<std::mutex> lock(_cacheMutex);
    _userAgentCache.try_emplace(userAgentKey, pRule);
  }
  return pRule;
}

bool DirectoryEntryFilter::shouldHide(std::string_view userAgent, std::string_view fileName) const {
  if (!_enable) {
    return false;
  }
  const Rule* pRule = resolveRuleForUserAgent(userAgent);
  if (pRule == nullptr) {
    return false;
  }
  const bool hide = PrefixMatch(pRule->fileNameRegex, fileName);
  log::debug("Rule:{}, File:{}, {}", pRule->fileNamePattern, fileName, hide ? "hide it" : "show it");
  return hide;
}

std::size_t DirectoryEntryFilter::nbCachedUserAgents() const {
  std::lock_guard<std::mutex> lock(_cacheMutex);
  return _userAgentCache.size();
}

}  // namespace davgate
