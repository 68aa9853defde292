#include "davgate/md5.hpp"

#include <gtest/gtest.h>

namespace davgate {

TEST(Md5, KnownDigests) {
  EXPECT_EQ(Md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(Md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(Md5Hex("The quick brown fox jumps over the lazy dog"), "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5, JoinedWithColon) {
  EXPECT_EQ(Md5HexJoined({"a", "b", "c"}), Md5Hex("a:b:c"));
  EXPECT_EQ(Md5HexJoined({"single"}), Md5Hex("single"));
  EXPECT_EQ(Md5HexJoined({"", ""}), Md5Hex(":"));
}

// RFC 2617 section 3.5 example
TEST(Md5, Rfc2617Example) {
  const auto ha1 = Md5HexJoined({"Mufasa", "testrealm@host.com", "Circle Of Life"});
  const auto ha2 = Md5HexJoined({"GET", "/dir/index.html"});
  EXPECT_EQ(ha1, "939e7578ed9e3c518a452acee763bce9");
  EXPECT_EQ(ha2, "39aff3a2bab6126f332b942af96d3366");
  EXPECT_EQ(Md5HexJoined({ha1, "dcd98b7102dd2f0e8b11d0f600bfb0c093", "00000001", "0a4f113b", "auth", ha2}),
            "6629fae49393a05397450978507c4ef1");
}

}  // namespace davgate
