#include <format>
#include <unordered_set>

#include <tre/byte_cursor.hpp>
#include <tre/compression.hpp>
#include <tre/entry_index.hpp>
#include <tre/header.hpp>

namespace tre {

std::vector<uint8_t> encodeIndex(std::span<const Entry> entries) {
  std::vector<uint8_t> out;
  out.reserve(entries.size() * kIndexRecordSize);
  ByteWriter writer(out);

  for (const auto &entry : entries) {
    writer.u32(entry.nameHash);
    writer.u32(static_cast<uint32_t>(entry.method));
    writer.u32(entry.checksum);
    writer.u32(0); // reserved
    writer.u64(entry.size);
    writer.u64(entry.storedSize);
    writer.u64(entry.offset);
    writer.bytes(entry.contentHash);
  }

  return out;
}

std::optional<std::vector<Entry>> decodeIndex(std::span<const uint8_t> data, uint32_t count,
                                              uint64_t dataSize, Error *outError) {
  if (data.size() / kIndexRecordSize < count) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("Index too small for {} records (size: {})", count, data.size()));
    return std::nullopt;
  }

  ByteReader reader(data);
  std::vector<Entry> entries;
  entries.reserve(count);
  std::unordered_set<uint32_t> seen;
  seen.reserve(count);

  for (uint32_t i = 0; i < count; ++i) {
    size_t recordOffset = reader.position();

    Entry entry;
    uint32_t method = 0;
    uint32_t reserved = 0;
    reader.u32(entry.nameHash);
    reader.u32(method);
    reader.u32(entry.checksum);
    reader.u32(reserved);
    reader.u64(entry.size);
    reader.u64(entry.storedSize);
    reader.u64(entry.offset);
    reader.bytes(entry.contentHash);
    entry.method = static_cast<CompressionMethod>(method);

    if (entry.offset > dataSize || entry.storedSize > dataSize - entry.offset) {
      detail::fail(outError, ErrorCode::CorruptIndex,
                   std::format("Index record {} has invalid offset/size (offset={}, "
                               "storedSize={}, dataSize={})",
                               i, entry.offset, entry.storedSize, dataSize));
      if (outError) {
        outError->nameHash = entry.nameHash;
        outError->offset = recordOffset;
      }
      return std::nullopt;
    }

    // Caps the allocation a forged size can force at extraction
    if (entry.size > maxDecodedSize(entry.method, entry.storedSize)) {
      detail::fail(outError, ErrorCode::CorruptIndex,
                   std::format("Index record {} claims {} bytes from {} stored bytes ({})", i,
                               entry.size, entry.storedSize, compressionMethodName(entry.method)));
      if (outError) {
        outError->nameHash = entry.nameHash;
        outError->offset = recordOffset;
      }
      return std::nullopt;
    }

    if (!seen.insert(entry.nameHash).second) {
      detail::fail(outError, ErrorCode::CorruptIndex,
                   std::format("Index record {} repeats name hash {:08x}", i, entry.nameHash));
      if (outError) {
        outError->nameHash = entry.nameHash;
        outError->offset = recordOffset;
      }
      return std::nullopt;
    }

    entries.push_back(std::move(entry));
  }

  return entries;
}

} // namespace tre
