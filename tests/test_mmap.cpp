#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include <tre/mmap.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class MappedFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "tre_test_mmap";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::vector<uint8_t> &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(reinterpret_cast<const char *>(content.data()),
               static_cast<std::streamsize>(content.size()));
    return filePath;
  }

  fs::path tempDir_;
};

TEST_F(MappedFileTest, OpenRead) {
  std::vector<uint8_t> content = {'E', 'E', 'R', 'T', '6', '0', '0', '0'};
  fs::path filePath = createTestFile("read.bin", content);

  tre::MappedFile mappedFile;
  tre::Error error;
  ASSERT_TRUE(mappedFile.openRead(filePath, &error)) << error.toString();
  EXPECT_TRUE(mappedFile.isOpen());
  EXPECT_EQ(mappedFile.size(), content.size());

  std::span<const uint8_t> data = std::as_const(mappedFile).data();
  EXPECT_TRUE(std::equal(data.begin(), data.end(), content.begin(), content.end()));

  mappedFile.close();
  EXPECT_FALSE(mappedFile.isOpen());
}

TEST_F(MappedFileTest, OpenNonExistent) {
  tre::MappedFile mappedFile;
  tre::Error error;

  EXPECT_FALSE(mappedFile.openRead(tempDir_ / "does_not_exist.tre", &error));
  EXPECT_FALSE(mappedFile.isOpen());
  EXPECT_EQ(error.code, tre::ErrorCode::IoError);
  EXPECT_FALSE(error.message.empty());
}

TEST_F(MappedFileTest, OpenEmptyFile) {
  fs::path filePath = tempDir_ / "empty.tre";
  std::ofstream(filePath).close();

  tre::MappedFile mappedFile;
  tre::Error error;
  EXPECT_FALSE(mappedFile.openRead(filePath, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::IoError);
}

// Positioned reads go through the ByteSource interface
TEST_F(MappedFileTest, ReadAt) {
  std::vector<uint8_t> content = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
  fs::path filePath = createTestFile("positioned.bin", content);

  tre::MappedFile mappedFile;
  ASSERT_TRUE(mappedFile.openRead(filePath));
  const tre::ByteSource &source = mappedFile;

  std::vector<uint8_t> out;
  tre::Error error;
  ASSERT_TRUE(source.read(3, 4, out, &error)) << error.toString();
  EXPECT_EQ(out, (std::vector<uint8_t>{3, 4, 5, 6}));

  ASSERT_TRUE(source.read(10, 0, out, &error));
  EXPECT_TRUE(out.empty());

  EXPECT_FALSE(source.read(8, 3, out, &error));
  EXPECT_EQ(error.code, tre::ErrorCode::IoError);

  uint8_t buffer[2];
  EXPECT_FALSE(mappedFile.readAt(UINT64_MAX, buffer, &error));
}

TEST_F(MappedFileTest, OpenWrite) {
  fs::path filePath = tempDir_ / "write.bin";
  size_t fileSize = 1024;

  tre::MappedFile mappedFile;
  tre::Error error;
  ASSERT_TRUE(mappedFile.openWrite(filePath, fileSize, &error)) << error.toString();
  EXPECT_EQ(mappedFile.size(), fileSize);

  auto data = mappedFile.data();
  for (size_t i = 0; i < fileSize; ++i) {
    data[i] = static_cast<uint8_t>(i & 0xFF);
  }

  ASSERT_TRUE(mappedFile.flush(&error)) << error.toString();
  mappedFile.close();

  std::ifstream verifyFile(filePath, std::ios::binary);
  std::vector<uint8_t> verifyData(fileSize);
  verifyFile.read(reinterpret_cast<char *>(verifyData.data()),
                  static_cast<std::streamsize>(fileSize));
  for (size_t i = 0; i < fileSize; ++i) {
    EXPECT_EQ(verifyData[i], static_cast<uint8_t>(i & 0xFF)) << "Mismatch at index " << i;
  }
}

TEST_F(MappedFileTest, OpenWriteZeroSize) {
  tre::MappedFile mappedFile;
  tre::Error error;

  EXPECT_FALSE(mappedFile.openWrite(tempDir_ / "zero.bin", 0, &error));
  EXPECT_FALSE(mappedFile.isOpen());
  EXPECT_EQ(error.code, tre::ErrorCode::IoError);
}

// A read-only mapping cannot be flushed
TEST_F(MappedFileTest, FlushReadOnly) {
  fs::path filePath = createTestFile("readonly.bin", {1, 2, 3});

  tre::MappedFile mappedFile;
  ASSERT_TRUE(mappedFile.openRead(filePath));

  tre::Error error;
  EXPECT_FALSE(mappedFile.flush(&error));
  EXPECT_EQ(error.code, tre::ErrorCode::IoError);
}

TEST_F(MappedFileTest, MoveConstruction) {
  std::vector<uint8_t> content = {1, 2, 3, 4, 5};
  fs::path filePath = createTestFile("move.bin", content);

  tre::MappedFile mappedFile1;
  ASSERT_TRUE(mappedFile1.openRead(filePath));

  tre::MappedFile mappedFile2(std::move(mappedFile1));
  EXPECT_FALSE(mappedFile1.isOpen());
  EXPECT_TRUE(mappedFile2.isOpen());

  std::vector<uint8_t> out;
  ASSERT_TRUE(mappedFile2.read(0, content.size(), out));
  EXPECT_EQ(out, content);
}

TEST_F(MappedFileTest, MoveAssignment) {
  std::vector<uint8_t> content1 = {1, 2, 3};
  std::vector<uint8_t> content2 = {4, 5, 6, 7};
  fs::path filePath1 = createTestFile("move1.bin", content1);
  fs::path filePath2 = createTestFile("move2.bin", content2);

  tre::MappedFile mappedFile1;
  tre::MappedFile mappedFile2;
  ASSERT_TRUE(mappedFile1.openRead(filePath1));
  ASSERT_TRUE(mappedFile2.openRead(filePath2));

  mappedFile1 = std::move(mappedFile2);
  EXPECT_TRUE(mappedFile1.isOpen());
  EXPECT_FALSE(mappedFile2.isOpen());

  std::vector<uint8_t> out;
  ASSERT_TRUE(mappedFile1.read(0, mappedFile1.size(), out));
  EXPECT_EQ(out, content2);
}

TEST_F(MappedFileTest, LargeFile) {
  size_t fileSize = 1024 * 1024;
  std::vector<uint8_t> content(fileSize);
  for (size_t i = 0; i < fileSize; ++i) {
    content[i] = static_cast<uint8_t>(i * 7 % 256);
  }
  fs::path filePath = createTestFile("large.bin", content);

  tre::MappedFile mappedFile;
  ASSERT_TRUE(mappedFile.openRead(filePath));
  EXPECT_EQ(mappedFile.size(), fileSize);

  std::vector<uint8_t> out;
  ASSERT_TRUE(mappedFile.read(fileSize - 16, 16, out));
  EXPECT_TRUE(std::equal(out.begin(), out.end(), content.end() - 16));
}
