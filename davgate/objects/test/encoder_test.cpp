#include "davgate/encoder.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "davgate/compression-config.hpp"
#include "davgate/compression-method.hpp"
#include "davgate/compression-test-helpers.hpp"
#include "davgate/features.hpp"

namespace davgate {

namespace {

std::string MakePayload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  static constexpr std::string_view kWords = "<d:response><d:href>/dav/file.txt</d:href></d:response>\n";
  while (payload.size() < size) {
    payload.append(kWords.substr(0, size - payload.size()));
  }
  return payload;
}

// Feeds 'payload' in 'nbChunks' roughly equal chunks, the last one with finish=true.
std::string StreamEncode(EncoderContext& ctx, std::string_view payload, std::size_t nbChunks) {
  std::string out;
  const std::size_t chunkSize = (payload.size() + nbChunks - 1) / nbChunks;
  for (std::size_t chunk = 0; chunk < nbChunks; ++chunk) {
    const auto part = payload.substr(std::min(payload.size(), chunk * chunkSize), chunkSize);
    out.append(ctx.encode(part, chunk + 1 == nbChunks));
  }
  return out;
}

class EncoderTest : public ::testing::TestWithParam<CompressionMethod> {
 protected:
  void SetUp() override {
    if (!IsCompressionMethodEnabled(GetParam())) {
      GTEST_SKIP() << GetContentEncodingStr(GetParam()) << " support is not compiled";
    }
  }

  static std::string Decompress(std::string_view compressed) {
    return GetParam() == CompressionMethod::Gzip ? test::GzipDecompress(compressed)
                                                 : test::BrotliDecompress(compressed);
  }
};

}  // namespace

TEST_P(EncoderTest, SingleChunkWithFinish) {
  CompressionConfig config;
  auto ctx = MakeEncoderContext(GetParam(), config);
  const auto payload = MakePayload(5000);
  const std::string compressed(ctx->encode(payload, true));
  EXPECT_LT(compressed.size(), payload.size());
  EXPECT_EQ(Decompress(compressed), payload);
  if (GetParam() == CompressionMethod::Gzip) {
    EXPECT_TRUE(test::HasGzipMagic(compressed));
  }
}

TEST_P(EncoderTest, ManyChunks) {
  CompressionConfig config;
  config.encoderChunkSize = 64;  // forces several buffer growths per call
  auto ctx = MakeEncoderContext(GetParam(), config);
  const auto payload = MakePayload(100000);
  EXPECT_EQ(Decompress(StreamEncode(*ctx, payload, 17)), payload);
}

TEST_P(EncoderTest, EmptyFinalChunk) {
  CompressionConfig config;
  auto ctx = MakeEncoderContext(GetParam(), config);
  const auto payload = MakePayload(3000);
  std::string out(ctx->encode(payload, false));
  out.append(ctx->encode({}, true));
  EXPECT_EQ(Decompress(out), payload);
}

TEST_P(EncoderTest, EmptyStream) {
  CompressionConfig config;
  auto ctx = MakeEncoderContext(GetParam(), config);
  const std::string out(ctx->encode({}, true));
  EXPECT_FALSE(out.empty());
  EXPECT_EQ(Decompress(out), "");
}

TEST_P(EncoderTest, AllLevels) {
  const auto payload = MakePayload(20000);
  for (CompressionLevel level : {CompressionLevel::Fast, CompressionLevel::Default, CompressionLevel::Best}) {
    CompressionConfig config;
    config.level = level;
    auto ctx = MakeEncoderContext(GetParam(), config);
    EXPECT_EQ(Decompress(StreamEncode(*ctx, payload, 3)), payload);
  }
}

INSTANTIATE_TEST_SUITE_P(Codecs, EncoderTest, ::testing::Values(CompressionMethod::Gzip, CompressionMethod::Brotli),
                         [](const auto& info) { return std::string(GetContentEncodingStr(info.param)); });

TEST(EncoderFactory, NoneHasNoEncoder) {
  CompressionConfig config;
  EXPECT_THROW(MakeEncoderContext(CompressionMethod::None, config), std::invalid_argument);
}

TEST(EncoderFactory, DisabledCodecHasNoEncoder) {
  CompressionConfig config;
  if constexpr (!brotliEnabled()) {
    EXPECT_THROW(MakeEncoderContext(CompressionMethod::Brotli, config), std::invalid_argument);
  }
  if constexpr (!zlibEnabled()) {
    EXPECT_THROW(MakeEncoderContext(CompressionMethod::Gzip, config), std::invalid_argument);
  }
}

}  // namespace davgate
