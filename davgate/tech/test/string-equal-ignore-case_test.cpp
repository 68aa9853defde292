#include "davgate/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_map>

#include "davgate/string-trim.hpp"

namespace davgate {

TEST(StringEqualIgnoreCase, AsciiToLower) {
  static_assert(AsciiToLower('A') == 'a');
  EXPECT_EQ(AsciiToLower('Z'), 'z');
  EXPECT_EQ(AsciiToLower('z'), 'z');
  EXPECT_EQ(AsciiToLower('-'), '-');
  EXPECT_EQ(AsciiToLower('\xC9'), '\xC9');
}

TEST(StringEqualIgnoreCase, EqualStrings) {
  EXPECT_TRUE(CaseInsensitiveEqual("hello", "HELLO"));
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Type", "content-type"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
}

TEST(StringEqualIgnoreCase, UnequalStrings) {
  EXPECT_FALSE(CaseInsensitiveEqual("hello", "world"));
  EXPECT_FALSE(CaseInsensitiveEqual("HELLO", "hell"));
}

TEST(StringEqualIgnoreCase, StartsWith) {
  EXPECT_TRUE(StartsWithCaseInsensitive("Digest username=\"a\"", "digest "));
  EXPECT_TRUE(StartsWithCaseInsensitive("BASIC abc", "Basic"));
  EXPECT_FALSE(StartsWithCaseInsensitive("Dig", "digest"));
  EXPECT_TRUE(StartsWithCaseInsensitive("anything", ""));
}

TEST(StringEqualIgnoreCase, HashMap) {
  std::unordered_map<std::string, int, CaseInsensitiveHashFunc, CaseInsensitiveEqualFunc> map;
  map["User-Agent"] = 1;
  EXPECT_EQ(map.count("user-agent"), 1U);
  EXPECT_EQ(map.count("USER-AGENT"), 1U);
  EXPECT_EQ(map.count("user-agen"), 0U);
  EXPECT_EQ(CaseInsensitiveHashFunc{}("Accept"), CaseInsensitiveHashFunc{}("aCCEPT"));
}

TEST(StringTrim, Ows) {
  EXPECT_EQ(TrimOws("  \tgzip \t"), "gzip");
  EXPECT_EQ(TrimOws(" "), "");
  EXPECT_EQ(TrimOws("a b"), "a b");
}

TEST(StringTrim, Chars) {
  EXPECT_EQ(TrimChars(" \"value\" ", " \""), "value");
  EXPECT_EQ(TrimChars("\"\"", " \""), "");
  EXPECT_EQ(TrimChars("auth", " \""), "auth");
}

}  // namespace davgate
