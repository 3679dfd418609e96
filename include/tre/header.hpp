#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace tre {

// "TREE" as a little-endian tag
inline constexpr char kMagic[4] = {'E', 'E', 'R', 'T'};

// Versions are four ASCII digits stored reversed ("6000" is version 6).
// Classic TRE files carry "5000" and use an incompatible layout.
constexpr uint32_t kFormatVersion = 6;
constexpr uint32_t kMinVersion = 6;
constexpr uint32_t kMaxVersion = 6;

// Size of one EntryIndex record
constexpr size_t kIndexRecordSize = 56;

// Archive header (64 bytes, little-endian)
struct Header {
  uint32_t version = kFormatVersion;
  uint32_t entryCount = 0;
  CompressionMethod nameCompression = CompressionMethod::Store;
  uint64_t indexOffset = 0;
  uint64_t nameOffset = 0;
  uint64_t nameStoredSize = 0; // Size of the name table in the file
  uint64_t nameSize = 0;       // Size of the name table once decompressed
  uint64_t dataOffset = 0;
  uint64_t dataSize = 0;

  uint64_t indexSize() const { return static_cast<uint64_t>(entryCount) * kIndexRecordSize; }

  static constexpr size_t headerSize = 64;
};

std::vector<uint8_t> encodeHeader(const Header &header);

// Fails with InvalidMagic, UnsupportedVersion, or CorruptIndex for a short buffer
std::optional<Header> decodeHeader(std::span<const uint8_t> data, Error *outError = nullptr);

} // namespace tre
