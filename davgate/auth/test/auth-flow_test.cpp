#include <gtest/gtest.h>

#include <string>

#include "davgate/authenticator.hpp"
#include "davgate/compression-negotiator.hpp"
#include "davgate/dav-request.hpp"
#include "davgate/dav-response.hpp"
#include "davgate/digest-fields.hpp"
#include "davgate/gateway-config.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/recording-channel.hpp"
#include "davgate/streaming-sender.hpp"

namespace davgate {

namespace {

class AuthFlowTest : public ::testing::Test {
 protected:
  static GatewayConfig MakeConfig() {
    GatewayConfig config;
    config.withAccount("alice", "secret");
    config.withDigestAuth(DigestAuthConfig{false, "WebDAVFS", "neon/"});
    return config;
  }

  GatewayConfig config{MakeConfig()};
  Authenticator authenticator{config};
  CompressionNegotiator negotiator{config.compression};
  StreamingSender sender{negotiator, config.response};
  test::RecordingChannel channel;
};

}  // namespace

TEST_F(AuthFlowTest, UnauthorizedResponseIsSent) {
  DavRequest request("PROPFIND", "/", {{"User-Agent", "curl/8.0"}, {"Accept-Encoding", "gzip"}});
  const auto result = authenticator.authenticate(request);
  ASSERT_FALSE(result.authenticated());

  auto response = authenticator.buildChallengeResponse(request, result.failureReason);
  sender.send(response, request, channel);
  EXPECT_EQ(channel.start().status, http::StatusCodeUnauthorized);
  EXPECT_EQ(*channel.start().headers.find("WWW-Authenticate"), R"(Basic realm="ASGI-WebDAV")");
  // the page is below the compression threshold
  EXPECT_FALSE(channel.start().headers.contains("Content-Encoding"));
  EXPECT_NE(channel.body().find("401 Unauthorized. missing header: authorization"), std::string::npos);
  EXPECT_TRUE(channel.complete());
}

TEST_F(AuthFlowTest, DigestMutualAuthenticationEchoed) {
  DigestFields fields{{"username", "alice"},
                      {"realm", "ASGI-WebDAV"},
                      {"nonce", authenticator.digest().generateNonce()},
                      {"uri", "/notes.txt"},
                      {"algorithm", "MD5"},
                      {"opaque", std::string(authenticator.digest().opaque())},
                      {"qop", "auth"},
                      {"nc", "00000002"},
                      {"cnonce", "f2c3a1"}};
  fields.set("response", authenticator.digest().buildRequestDigest(fields, {"alice", "secret", {}, false}, "GET"));

  DavRequest request("GET", "/notes.txt", {{"Authorization", "Digest " + BuildAuthorizationString(fields)}});
  const auto result = authenticator.authenticate(request);
  ASSERT_TRUE(result.authenticated()) << result.failureReason;

  DavResponse response(http::StatusCodeOK, {}, ResponseType::Html, std::string("hello"));
  sender.send(response, request, channel);
  const std::string* authInfo = channel.start().headers.find("Authentication-Info");
  ASSERT_NE(authInfo, nullptr);
  EXPECT_EQ(*authInfo, result.mutualAuthInfo);
  EXPECT_NE(authInfo->find(R"(cnonce="f2c3a1", qop=auth, nc=00000002)"), std::string::npos);
  EXPECT_EQ(channel.body(), "hello");
}

}  // namespace davgate
