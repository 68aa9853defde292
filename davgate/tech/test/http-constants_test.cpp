#include "davgate/http-constants.hpp"

#include <gtest/gtest.h>

#include "davgate/http-status-code.hpp"

namespace davgate::http {

TEST(HttpConstants, ReasonPhrases) {
  EXPECT_EQ(ReasonPhraseFor(StatusCodeOK), "OK");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeUnauthorized), "Unauthorized");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeMethodNotAllowed), "Method Not Allowed");
  EXPECT_EQ(ReasonPhraseFor(StatusCodeMultiStatus), "Multi-Status");
  EXPECT_TRUE(ReasonPhraseFor(299).empty());
}

}  // namespace davgate::http
