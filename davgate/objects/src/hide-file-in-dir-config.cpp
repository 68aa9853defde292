#include "davgate/hide-file-in-dir-config.hpp"

#include "davgate/regex-rule.hpp"

namespace davgate {

void HideFileInDirConfig::validate() const {
  for (const auto &[userAgentRule, fileNameRule] : userRules) {
    if (!userAgentRule.empty()) {
      (void)CompileRule("hide file user agent", userAgentRule);
    }
    (void)CompileRule("hide file name", fileNameRule);
  }
}

}  // namespace davgate
