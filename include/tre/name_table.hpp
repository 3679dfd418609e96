#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace tre {

// name hash -> literal name
using NameTable = std::unordered_map<uint32_t, std::string>;

// Name table as laid out in the file
struct NameTableBlock {
  CompressionMethod method = CompressionMethod::Store;
  std::vector<uint8_t> bytes; // Stored (possibly deflated) bytes
  uint64_t rawSize = 0;       // Size before compression
};

// Serialize (hash, name) records in entry order. The block is deflated when
// its raw size exceeds `threshold` and deflate makes it smaller.
std::optional<NameTableBlock> encodeNameTable(std::span<const Entry> entries, size_t threshold,
                                              int level, Error *outError = nullptr);

// Parse a stored name table and cross-check it against the index: every entry
// needs exactly one record, and every record must belong to an entry.
std::optional<NameTable> decodeNameTable(std::span<const uint8_t> stored, CompressionMethod method,
                                         uint64_t rawSize, std::span<const Entry> entries,
                                         Error *outError = nullptr);

} // namespace tre
