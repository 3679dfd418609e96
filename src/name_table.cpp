#include <format>
#include <unordered_set>

#include <tre/byte_cursor.hpp>
#include <tre/checksum.hpp>
#include <tre/compression.hpp>
#include <tre/name_table.hpp>

namespace tre {

namespace {

bool corrupt(Error *outError, std::string message, uint32_t hash, uint64_t offset) {
  detail::fail(outError, ErrorCode::CorruptIndex, std::move(message));
  if (outError) {
    outError->nameHash = hash;
    outError->offset = offset;
  }
  return false;
}

bool parseRecords(std::span<const uint8_t> raw, std::span<const Entry> entries, NameTable &table,
                  Error *outError) {
  std::unordered_set<uint32_t> referenced;
  referenced.reserve(entries.size());
  for (const auto &entry : entries) {
    referenced.insert(entry.nameHash);
  }

  ByteReader reader(raw);
  table.reserve(entries.size());

  while (!reader.atEnd()) {
    size_t recordOffset = reader.position();
    uint32_t hash = 0;
    uint16_t length = 0;
    std::string name;

    if (!reader.u32(hash) || !reader.u16(length) || !reader.string(length, name)) {
      return corrupt(outError, std::format("Truncated name record at offset {}", recordOffset),
                     hash, recordOffset);
    }

    if (name.empty()) {
      return corrupt(outError, std::format("Empty name for hash {:08x}", hash), hash,
                     recordOffset);
    }

    if (nameHash(name) != hash) {
      return corrupt(outError,
                     std::format("Name '{}' does not match its hash {:08x}", name, hash), hash,
                     recordOffset);
    }

    if (!referenced.contains(hash)) {
      return corrupt(outError, std::format("Name '{}' is not referenced by the index", name),
                     hash, recordOffset);
    }

    if (!table.emplace(hash, std::move(name)).second) {
      return corrupt(outError, std::format("Duplicate name record for hash {:08x}", hash), hash,
                     recordOffset);
    }
  }

  for (const auto &entry : entries) {
    if (!table.contains(entry.nameHash)) {
      return corrupt(outError, std::format("No name for index hash {:08x}", entry.nameHash),
                     entry.nameHash, 0);
    }
  }

  return true;
}

} // namespace

std::optional<NameTableBlock> encodeNameTable(std::span<const Entry> entries, size_t threshold,
                                              int level, Error *outError) {
  std::vector<uint8_t> raw;
  ByteWriter writer(raw);

  for (const auto &entry : entries) {
    writer.u32(entry.nameHash);
    writer.u16(static_cast<uint16_t>(entry.name.size()));
    writer.bytes(entry.name);
  }

  NameTableBlock block;
  block.rawSize = raw.size();

  if (raw.size() > threshold) {
    auto compressed = compress(raw, level, outError);
    if (!compressed) {
      return std::nullopt;
    }
    block.method = compressed->method;
    block.bytes = std::move(compressed->bytes);
  } else {
    block.method = CompressionMethod::Store;
    block.bytes = std::move(raw);
  }

  return block;
}

std::optional<NameTable> decodeNameTable(std::span<const uint8_t> stored, CompressionMethod method,
                                         uint64_t rawSize, std::span<const Entry> entries,
                                         Error *outError) {
  Error codecError;
  auto raw = decompress(method, stored, rawSize, &codecError);
  if (!raw) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("Unreadable name table: {}", codecError.message));
    return std::nullopt;
  }

  NameTable table;
  if (!parseRecords(*raw, entries, table, outError)) {
    return std::nullopt;
  }

  return table;
}

} // namespace tre
