#include "davgate/gateway-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "davgate/hide-file-in-dir-config.hpp"

namespace davgate {

TEST(GatewayConfig, Defaults) {
  GatewayConfig config;
  EXPECT_EQ(config.realm, "ASGI-WebDAV");
  EXPECT_FALSE(config.digestAuth.enable);
  EXPECT_EQ(config.digestAuth.disableRule, "neon/");
  EXPECT_TRUE(config.digestAuth.enableRule.empty());
  EXPECT_TRUE(config.hideFileInDir.enable);
  EXPECT_TRUE(config.hideFileInDir.enableDefaultRules);
  EXPECT_EQ(config.response.blockSize, 64U * 1024U);
  EXPECT_NO_THROW(config.validate());
}

TEST(GatewayConfig, Accounts) {
  GatewayConfig config;
  config.withAccount("alice", "secret", {"+^/"}, true).withAccount("bob", "pw");
  ASSERT_EQ(config.accounts.size(), 2U);
  EXPECT_TRUE(config.accounts[0].admin);
  EXPECT_EQ(config.accounts[0].permissions.front(), "+^/");
  EXPECT_NO_THROW(config.validate());

  config.withAccount("", "nopass");
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GatewayConfig, UsernameWithColonInvalid) {
  GatewayConfig config;
  config.withAccount("ali:ce", "secret");
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GatewayConfig, UsernameWithQuoteOrCommaAccepted) {
  GatewayConfig config;
  config.withAccount("o'brien,jr", "secret").withAccount("say\"hi\"", "pw");
  EXPECT_NO_THROW(config.validate());
}

TEST(GatewayConfig, InvalidRealm) {
  GatewayConfig config;
  config.realm = "a\"b";
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.realm.clear();
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GatewayConfig, InvalidDigestRule) {
  GatewayConfig config;
  config.digestAuth.enableRule = "[";
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GatewayConfig, InvalidHideRule) {
  GatewayConfig config;
  config.withHideFileInDir(HideFileInDirConfig{}.withUserRule("curl", "*bad"));
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(GatewayConfig, ZeroBlockSize) {
  GatewayConfig config;
  config.response.blockSize = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace davgate
