#include "davgate/credential-store.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "davgate/account-config.hpp"
#include "davgate/basic-auth.hpp"

namespace davgate {

TEST(CredentialStore, BasicCredential) {
  EXPECT_EQ(CredentialStore::BasicCredential("alice", "secret"), "YWxpY2U6c2VjcmV0");
  EXPECT_EQ(CredentialStore::BasicCredential("Aladdin", "open sesame"), "QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
}

TEST(CredentialStore, Lookups) {
  CredentialStore store(std::vector<AccountConfig>{{"alice", "secret", {"+^/"}, true}, {"bob", "pwd", {}, false}});
  EXPECT_EQ(store.size(), 2U);

  const auto* alice = store.findByUsername("alice");
  ASSERT_NE(alice, nullptr);
  EXPECT_EQ(alice->password, "secret");
  EXPECT_TRUE(alice->admin);
  ASSERT_EQ(alice->permissions.size(), 1U);
  EXPECT_EQ(store.findByBasicCredential("YWxpY2U6c2VjcmV0"), alice);

  EXPECT_EQ(store.findByUsername("carol"), nullptr);
  EXPECT_EQ(store.findByUsername("Alice"), nullptr);
  EXPECT_EQ(store.findByBasicCredential("YWxpY2U6c2VjcmV1"), nullptr);
  EXPECT_EQ(store.findByBasicCredential(""), nullptr);
}

TEST(CredentialStore, LastDefinitionWins) {
  CredentialStore store(std::vector<AccountConfig>{{"alice", "old", {}, false}, {"alice", "new", {}, true}});
  EXPECT_EQ(store.size(), 1U);
  const auto* alice = store.findByUsername("alice");
  ASSERT_NE(alice, nullptr);
  EXPECT_EQ(alice->password, "new");
  EXPECT_EQ(store.findByBasicCredential(CredentialStore::BasicCredential("alice", "new")), alice);
  EXPECT_EQ(store.findByBasicCredential(CredentialStore::BasicCredential("alice", "old")), nullptr);
}

TEST(BasicAuthenticator, Scheme) {
  EXPECT_TRUE(BasicAuthenticator::IsCredential("Basic abc"));
  EXPECT_TRUE(BasicAuthenticator::IsCredential("BASIC abc"));
  EXPECT_TRUE(BasicAuthenticator::IsCredential("basic "));
  EXPECT_FALSE(BasicAuthenticator::IsCredential("Basicabc"));
  EXPECT_FALSE(BasicAuthenticator::IsCredential("Digest username=\"a\""));
  EXPECT_FALSE(BasicAuthenticator::IsCredential(""));
}

TEST(BasicAuthenticator, ChallengeAndVerify) {
  CredentialStore store(std::vector<AccountConfig>{{"alice", "secret", {}, false}});
  BasicAuthenticator basic("ASGI-WebDAV", store);
  EXPECT_EQ(basic.challengeString(), R"(Basic realm="ASGI-WebDAV")");

  const auto* alice = basic.verify("Basic YWxpY2U6c2VjcmV0");
  ASSERT_NE(alice, nullptr);
  EXPECT_EQ(alice->username, "alice");
  EXPECT_EQ(basic.verify("basic YWxpY2U6c2VjcmV0"), alice);
  EXPECT_EQ(basic.verify("Basic  YWxpY2U6c2VjcmV0"), nullptr);
  EXPECT_EQ(basic.verify("Basic"), nullptr);
  EXPECT_EQ(basic.verify("Digest YWxpY2U6c2VjcmV0"), nullptr);
}

TEST(BasicAuthenticator, AnySingleByteMutationFails) {
  CredentialStore store(std::vector<AccountConfig>{{"alice", "secret", {}, false}, {"bob", "hunter2", {}, false}});
  BasicAuthenticator basic("realm", store);
  const std::string token = CredentialStore::BasicCredential("alice", "secret");
  ASSERT_NE(basic.verify("Basic " + token), nullptr);
  for (std::size_t pos = 0; pos < token.size(); ++pos) {
    std::string mutated = token;
    mutated[pos] = static_cast<char>(mutated[pos] ^ 0x01);
    EXPECT_EQ(basic.verify("Basic " + mutated), nullptr) << "position " << pos;
  }
}

}  // namespace davgate
