#include <cstdint>
#include <string>
#include <vector>

#include <tre/compression.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> repetitive(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>("hello world "[i % 12]);
  }
  return data;
}

// Pseudo-random bytes that deflate cannot shrink
std::vector<uint8_t> noise(size_t size) {
  std::vector<uint8_t> data(size);
  uint32_t state = 0x12345678;
  for (auto &byte : data) {
    state = state * 1664525u + 1013904223u;
    byte = static_cast<uint8_t>(state >> 24);
  }
  return data;
}

} // namespace

TEST(CompressionTest, RepetitiveDataIsDeflated) {
  auto data = repetitive(4096);
  tre::Error error;
  auto result = tre::compress(data, -1, &error);
  ASSERT_TRUE(result) << error.toString();

  EXPECT_EQ(result->method, tre::CompressionMethod::Deflate);
  EXPECT_LT(result->bytes.size(), data.size());

  auto restored = tre::decompress(result->method, result->bytes, data.size(), &error);
  ASSERT_TRUE(restored) << error.toString();
  EXPECT_EQ(*restored, data);
}

TEST(CompressionTest, IncompressibleDataIsStored) {
  auto data = noise(256);
  auto result = tre::compress(data, -1);
  ASSERT_TRUE(result);

  EXPECT_EQ(result->method, tre::CompressionMethod::Store);
  EXPECT_EQ(result->bytes, data);
}

TEST(CompressionTest, EmptyInputIsStored) {
  auto result = tre::compress({}, -1);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->method, tre::CompressionMethod::Store);
  EXPECT_TRUE(result->bytes.empty());

  auto restored = tre::decompress(result->method, result->bytes, 0);
  ASSERT_TRUE(restored);
  EXPECT_TRUE(restored->empty());
}

TEST(CompressionTest, ForcedDeflateKeepsLargerOutput) {
  auto data = noise(64);
  auto result = tre::compressWith(tre::CompressionMethod::Deflate, data, 9);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->method, tre::CompressionMethod::Deflate);

  auto restored = tre::decompress(result->method, result->bytes, data.size());
  ASSERT_TRUE(restored);
  EXPECT_EQ(*restored, data);
}

TEST(CompressionTest, SizeMismatchIsRejected) {
  auto data = repetitive(1000);
  tre::Compressed deflated = *tre::compress(data, -1);
  ASSERT_EQ(deflated.method, tre::CompressionMethod::Deflate);

  tre::Error error;
  EXPECT_FALSE(tre::decompress(deflated.method, deflated.bytes, 999, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);

  EXPECT_FALSE(tre::decompress(deflated.method, deflated.bytes, 1001, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);

  EXPECT_FALSE(tre::decompress(tre::CompressionMethod::Store, data, 10, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
}

TEST(CompressionTest, MalformedStreamIsRejected) {
  std::vector<uint8_t> garbage = {0xde, 0xad, 0xbe, 0xef, 0x00, 0x11, 0x22};

  tre::Error error;
  EXPECT_FALSE(tre::decompress(tre::CompressionMethod::Deflate, garbage, 100, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
  EXPECT_FALSE(error.message.empty());
}

TEST(CompressionTest, TruncatedStreamIsRejected) {
  auto data = repetitive(2048);
  tre::Compressed deflated = *tre::compress(data, -1);
  deflated.bytes.resize(deflated.bytes.size() / 2);

  tre::Error error;
  EXPECT_FALSE(tre::decompress(deflated.method, deflated.bytes, data.size(), &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
}

TEST(CompressionTest, UnknownMethodIsRejected) {
  std::vector<uint8_t> data = {1, 2, 3};

  tre::Error error;
  EXPECT_FALSE(tre::decompress(static_cast<tre::CompressionMethod>(7), data, 3, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
}

TEST(CompressionTest, MethodNames) {
  EXPECT_EQ(tre::compressionMethodName(tre::CompressionMethod::Store), "store");
  EXPECT_EQ(tre::compressionMethodName(tre::CompressionMethod::Deflate), "deflate");
}

// An out-of-range level falls back to the zlib default
TEST(CompressionTest, InvalidLevelStillDeflates) {
  auto data = repetitive(4096);
  auto result = tre::compress(data, 42);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->method, tre::CompressionMethod::Deflate);
  EXPECT_EQ(*tre::decompress(result->method, result->bytes, data.size()), data);
}

TEST(CompressionTest, DecodedSizeBound) {
  EXPECT_EQ(tre::maxDecodedSize(tre::CompressionMethod::Store, 100), 100u);
  EXPECT_EQ(tre::maxDecodedSize(tre::CompressionMethod::Deflate, 100), 100u * 1032 + 64);
  EXPECT_EQ(tre::maxDecodedSize(tre::CompressionMethod::Deflate, UINT64_MAX / 2), UINT64_MAX);
  EXPECT_EQ(tre::maxDecodedSize(static_cast<tre::CompressionMethod>(7), 1), UINT64_MAX);
}

// A tiny stream claiming a huge output is refused before any buffer is sized for it
TEST(CompressionTest, ImplausibleExpectedSizeIsRejected) {
  std::vector<uint8_t> zeros(10000);
  tre::Compressed deflated = *tre::compress(zeros, -1);
  ASSERT_EQ(deflated.method, tre::CompressionMethod::Deflate);

  tre::Error error;
  EXPECT_FALSE(tre::decompress(deflated.method, deflated.bytes, 0xFFFFFFF0ull, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
}

// zlib takes uInt lengths, so payloads are streamed in pieces. Small pieces
// exercise the same loop that handles payloads above 4 GiB.
TEST(CompressionTest, ChunkedStreamsMatchSinglePass) {
  auto data = noise(3000);
  auto text = repetitive(50000);
  data.insert(data.end(), text.begin(), text.end());

  tre::Error error;
  auto chunked = tre::detail::deflateChunked(data, -1, 7, &error);
  ASSERT_TRUE(chunked) << error.toString();

  std::vector<uint8_t> restored;
  ASSERT_TRUE(tre::detail::inflateChunked(*chunked, data.size(), restored, 5, &error))
      << error.toString();
  EXPECT_EQ(restored, data);

  // Streams from either path decode with either path
  auto whole = tre::decompress(tre::CompressionMethod::Deflate, *chunked, data.size(), &error);
  ASSERT_TRUE(whole) << error.toString();
  EXPECT_EQ(*whole, data);

  tre::Compressed single = *tre::compress(data, -1);
  ASSERT_TRUE(tre::detail::inflateChunked(single.bytes, data.size(), restored, 3, &error))
      << error.toString();
  EXPECT_EQ(restored, data);
}

TEST(CompressionTest, ChunkedInflateDetectsWrongSize) {
  auto data = repetitive(20000);
  auto deflated = tre::detail::deflateChunked(data, -1, 11, nullptr);
  ASSERT_TRUE(deflated);

  std::vector<uint8_t> out;
  tre::Error error;
  EXPECT_FALSE(tre::detail::inflateChunked(*deflated, data.size() - 1, out, 13, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
  EXPECT_FALSE(tre::detail::inflateChunked(*deflated, data.size() + 1, out, 13, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);

  std::vector<uint8_t> trailing = *deflated;
  trailing.push_back(0);
  EXPECT_FALSE(tre::detail::inflateChunked(trailing, data.size(), out, 13, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CompressionError);
}
