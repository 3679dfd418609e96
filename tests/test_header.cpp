#include <cstring>
#include <vector>

#include <tre/header.hpp>

#include <gtest/gtest.h>

namespace {

tre::Header sampleHeader() {
  tre::Header header;
  header.entryCount = 3;
  header.nameCompression = tre::CompressionMethod::Deflate;
  header.indexOffset = 64;
  header.nameOffset = 64 + 3 * tre::kIndexRecordSize;
  header.nameStoredSize = 40;
  header.nameSize = 55;
  header.dataOffset = header.nameOffset + 40;
  header.dataSize = 0x1'0000'0001ull; // needs all 64 bits
  return header;
}

} // namespace

TEST(HeaderTest, EncodedLayout) {
  std::vector<uint8_t> bytes = tre::encodeHeader(sampleHeader());
  ASSERT_EQ(bytes.size(), tre::Header::headerSize);

  EXPECT_EQ(std::memcmp(bytes.data(), "EERT", 4), 0);
  EXPECT_EQ(std::memcmp(bytes.data() + 4, "6000", 4), 0);

  // entryCount, little-endian
  EXPECT_EQ(bytes[8], 3);
  EXPECT_EQ(bytes[9], 0);
  EXPECT_EQ(bytes[10], 0);
  EXPECT_EQ(bytes[11], 0);

  // nameCompression
  EXPECT_EQ(bytes[12], 2);

  // dataSize is the last field
  EXPECT_EQ(bytes[56], 1);
  EXPECT_EQ(bytes[60], 1);
}

TEST(HeaderTest, DecodeRestoresFields) {
  tre::Header original = sampleHeader();
  std::vector<uint8_t> bytes = tre::encodeHeader(original);

  tre::Error error;
  auto decoded = tre::decodeHeader(bytes, &error);
  ASSERT_TRUE(decoded) << error.toString();

  EXPECT_EQ(decoded->version, tre::kFormatVersion);
  EXPECT_EQ(decoded->entryCount, original.entryCount);
  EXPECT_EQ(decoded->nameCompression, original.nameCompression);
  EXPECT_EQ(decoded->indexOffset, original.indexOffset);
  EXPECT_EQ(decoded->nameOffset, original.nameOffset);
  EXPECT_EQ(decoded->nameStoredSize, original.nameStoredSize);
  EXPECT_EQ(decoded->nameSize, original.nameSize);
  EXPECT_EQ(decoded->dataOffset, original.dataOffset);
  EXPECT_EQ(decoded->dataSize, original.dataSize);
  EXPECT_EQ(decoded->indexSize(), 3 * tre::kIndexRecordSize);
}

TEST(HeaderTest, RejectsWrongMagic) {
  std::vector<uint8_t> bytes = tre::encodeHeader(sampleHeader());
  std::memcpy(bytes.data(), "BIGF", 4);

  tre::Error error;
  EXPECT_FALSE(tre::decodeHeader(bytes, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::InvalidMagic);
  EXPECT_NE(error.message.find("BIGF"), std::string::npos);
}

// Classic TRE archives carry version "5000"
TEST(HeaderTest, RejectsClassicVersion) {
  std::vector<uint8_t> bytes = tre::encodeHeader(sampleHeader());
  std::memcpy(bytes.data() + 4, "5000", 4);

  tre::Error error;
  EXPECT_FALSE(tre::decodeHeader(bytes, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::UnsupportedVersion);
}

TEST(HeaderTest, RejectsNonNumericVersion) {
  std::vector<uint8_t> bytes = tre::encodeHeader(sampleHeader());
  std::memcpy(bytes.data() + 4, "60a0", 4);

  tre::Error error;
  EXPECT_FALSE(tre::decodeHeader(bytes, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::UnsupportedVersion);
}

TEST(HeaderTest, RejectsShortBuffer) {
  std::vector<uint8_t> bytes = tre::encodeHeader(sampleHeader());
  bytes.resize(tre::Header::headerSize - 1);

  tre::Error error;
  EXPECT_FALSE(tre::decodeHeader(bytes, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::CorruptIndex);
}
