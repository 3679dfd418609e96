#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tre {

// MD5 digest of an entry's uncompressed bytes
using ContentHash = std::array<uint8_t, 16>;

// Storage format of a block inside the archive (values match classic TRE files)
enum class CompressionMethod : uint32_t {
  Store = 0,
  Deflate = 2,
};

// Entry in the TRE archive
struct Entry {
  std::string name;            // Literal name, as added to the builder
  uint32_t nameHash = 0;       // CRC-32/BZIP2 of the normalized name
  CompressionMethod method = CompressionMethod::Store;
  uint32_t checksum = 0;       // CRC-32 of the stored bytes
  uint64_t size = 0;           // Uncompressed size
  uint64_t storedSize = 0;     // Size in the data section
  uint64_t offset = 0;         // Relative to the start of the data section
  ContentHash contentHash{};   // MD5 of the uncompressed bytes
};

// Longest literal name the name table can hold
constexpr size_t kMaxNameLength = 0xFFFF;

} // namespace tre
