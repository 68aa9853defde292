#include "davgate/digest-auth-config.hpp"

#include "davgate/regex-rule.hpp"

namespace davgate {

void DigestAuthConfig::validate() const {
  (void)CompileRule("digest enable", enableRule);
  (void)CompileRule("digest disable", disableRule);
}

}  // namespace davgate
