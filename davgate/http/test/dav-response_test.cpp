#include "davgate/dav-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "davgate/file.hpp"
#include "davgate/http-status-code.hpp"
#include "davgate/response-content.hpp"
#include "davgate/temp-file.hpp"

namespace davgate {

TEST(DavResponse, HtmlByDefault) {
  DavResponse response(http::StatusCodeOK);
  EXPECT_EQ(*response.headers().find("Content-Type"), "text/html");
  EXPECT_EQ(response.contentLength(), 0U);
  EXPECT_FALSE(response.contentRange());
  EXPECT_EQ(response.compressionMethod(), CompressionMethod::None);
}

TEST(DavResponse, ResponseTypes) {
  DavResponse xml(http::StatusCodeMultiStatus, {}, ResponseType::Xml, std::string("<multistatus/>"));
  EXPECT_EQ(*xml.headers().find("Content-Type"), "application/xml");
  EXPECT_EQ(xml.contentLength(), 14U);

  DavResponse undecided(http::StatusCodeOK, {}, ResponseType::Undecided);
  EXPECT_FALSE(undecided.headers().contains("Content-Type"));
}

TEST(DavResponse, ExtraHeadersMergedAfterType) {
  DavResponse response(http::StatusCodeOK, ResponseHeaders{{"content-type", "text/css"}, {"ETag", "\"1\""}});
  EXPECT_EQ(response.headers().size(), 2U);
  EXPECT_EQ(*response.headers().find("Content-Type"), "text/css");
}

TEST(DavResponse, ExplicitLengthOverridesContent) {
  DavResponse response(http::StatusCodeOK, {}, ResponseType::Html, std::string("abc"), 10U);
  EXPECT_EQ(response.contentLength(), 10U);
}

TEST(DavResponse, ContentRangeArithmetic) {
  DavResponse response(http::StatusCodePartialContent, {}, ResponseType::Undecided, std::string(), 20U, 5U);
  EXPECT_TRUE(response.contentRange());
  EXPECT_EQ(response.contentRangeStart(), 5U);
  EXPECT_EQ(response.contentLength(), 15U);
  EXPECT_EQ(*response.headers().find("Content-Range"), "bytes 5-20/20");
}

TEST(DavResponse, ContentRangeNeedsLength) {
  DavResponse response(http::StatusCodeOK, {}, ResponseType::Html, std::string("abc"), std::nullopt, 1U);
  EXPECT_FALSE(response.contentRange());
  EXPECT_FALSE(response.headers().contains("Content-Range"));
  EXPECT_EQ(response.contentLength(), 3U);
}

TEST(DavResponse, ContentRangeStartBeyondLength) {
  EXPECT_THROW(DavResponse(http::StatusCodePartialContent, {}, ResponseType::Html, std::string(), 4U, 5U),
               std::invalid_argument);
}

TEST(DavResponse, SetContentUpdatesLength) {
  DavResponse response(http::StatusCodeOK);
  response.setContent(std::string(42, 'x'));
  EXPECT_EQ(response.contentLength(), 42U);
  response.setContent(StreamContent{[] { return BodyChunk{"data", false}; }});
  EXPECT_FALSE(response.contentLength().has_value());
  EXPECT_EQ(ContentKindName(response.content()), "Stream");
}

TEST(DavResponse, ZeroCopyLength) {
  test::ScopedTempDir dir;
  test::ScopedTempFile tmp(dir, "file.bin", std::size_t{100});

  DavResponse response(http::StatusCodeOK);
  response.setContent(ZeroCopyFile{File(tmp.filePath().string()), 30U, std::nullopt});
  EXPECT_EQ(response.contentLength(), 70U);
  response.setContent(ZeroCopyFile{File(tmp.filePath().string()), 30U, 10U});
  EXPECT_EQ(response.contentLength(), 10U);
  response.setContent(ZeroCopyFile{File(tmp.filePath().string()), 200U, std::nullopt});
  EXPECT_EQ(response.contentLength(), 0U);
  EXPECT_EQ(ContentKindName(response.content()), "ZeroCopyFile");
}

TEST(DavResponse, MethodNotAllowed) {
  auto response = DavResponse::MethodNotAllowed("PATCH");
  EXPECT_EQ(response.status(), http::StatusCodeMethodNotAllowed);
  const auto& body = std::get<std::string>(response.content());
  EXPECT_EQ(body, "method:PATCH is not support method");
  EXPECT_EQ(response.contentLength(), body.size());
}

TEST(DavResponse, Describe) {
  DavResponse response(http::StatusCodeOK, {}, ResponseType::Xml, std::string("<a/>"));
  EXPECT_EQ(response.describe(), "200|4|Bytes|False|None\nContent-Type: application/xml");

  DavResponse ranged(http::StatusCodePartialContent, {}, ResponseType::Undecided, std::string(), 20U, 5U);
  EXPECT_EQ(ranged.describe(), "206|15|Bytes|True|5\nContent-Range: bytes 5-20/20");
}

}  // namespace davgate
