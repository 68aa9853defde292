#include "davgate/random-token.hpp"

#include <gtest/gtest.h>

#include <array>
#include <regex>
#include <set>
#include <string>

namespace davgate {

TEST(HexEncode, BothCases) {
  static constexpr std::array<unsigned char, 4> kBytes{0x00, 0x0F, 0xAB, 0xFF};
  EXPECT_EQ(HexEncode(kBytes), "000fabff");
  EXPECT_EQ(HexEncode(kBytes, HexCase::Upper), "000FABFF");
  EXPECT_TRUE(HexEncode({}).empty());
}

TEST(RandomHexToken, LowerCase) {
  const auto token = RandomHexToken();
  EXPECT_EQ(token.size(), 32U);
  EXPECT_TRUE(std::regex_match(token, std::regex("[0-9a-f]{32}")));
}

TEST(RandomHexToken, UpperCase) {
  const auto token = RandomHexToken(16, HexCase::Upper);
  EXPECT_TRUE(std::regex_match(token, std::regex("[0-9A-F]{32}")));
}

TEST(RandomHexToken, CustomLength) {
  EXPECT_EQ(RandomHexToken(4).size(), 8U);
  EXPECT_TRUE(RandomHexToken(0).empty());
}

TEST(RandomHexToken, Distinct) {
  std::set<std::string> tokens;
  for (int i = 0; i < 64; ++i) {
    tokens.insert(RandomHexToken());
  }
  EXPECT_EQ(tokens.size(), 64U);
}

}  // namespace davgate
