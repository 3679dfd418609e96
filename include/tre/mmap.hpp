#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "byte_source.hpp"
#include "error.hpp"

namespace tre {

// RAII wrapper for memory-mapped files
// Read-only mappings serve as archive sources; writable ones receive finalized archives
class MappedFile : public ByteSource {
public:
  MappedFile();
  ~MappedFile() override;

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing file read-only
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create (or truncate) a file of `size` bytes and map it read-write
  bool openWrite(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  uint64_t size() const override { return size_; }

  // Positioned copy out of the mapping; safe to call from several threads
  bool readAt(uint64_t offset, std::span<uint8_t> out, Error *outError = nullptr) const override;

  // Flush changes to disk (write mode only)
  bool flush(Error *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace tre
