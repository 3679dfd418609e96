#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "byte_source.hpp"
#include "error.hpp"
#include "header.hpp"
#include "ordered_map.hpp"
#include "types.hpp"

namespace tre {

// Read side of a TRE archive.
//
// open() parses header, index and name table once; afterwards every query is
// const and every extraction is an independent positioned read, so a single
// Reader can serve extractions from several threads. The Reader borrows its
// ByteSource, which must outlive it.
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Parse an archive. Stops at the first structural failure
  // (InvalidMagic, UnsupportedVersion, CorruptIndex, IoError).
  static std::optional<Reader> open(const ByteSource &source, Error *outError = nullptr);

  const Header &header() const { return header_; }

  // All entries in index order (no I/O)
  std::span<const Entry> entries() const { return entries_.values(); }

  size_t entryCount() const { return entries_.size(); }

  // Returns nullptr if out of range
  const Entry *entryAt(size_t index) const;

  // Case-insensitive lookup, returns nullptr if not found
  const Entry *findEntry(std::string_view name) const;
  const Entry *findEntryByHash(uint32_t nameHash) const;

  // Sum of uncompressed sizes
  uint64_t totalUncompressedSize() const;

  CompressionMethod nameCompression() const { return header_.nameCompression; }

  // Read, checksum and decompress one entry
  std::optional<std::vector<uint8_t>> extract(const Entry &entry, Error *outError = nullptr) const;

  // Lookup then extract; EntryNotFound on a miss
  std::optional<std::vector<uint8_t>> extract(std::string_view name,
                                              Error *outError = nullptr) const;
  std::optional<std::vector<uint8_t>> extractByHash(uint32_t nameHash,
                                                    Error *outError = nullptr) const;
  std::optional<std::vector<uint8_t>> extractAt(size_t index, Error *outError = nullptr) const;

  // Extract to disk, creating parent directories
  bool extractToFile(const Entry &entry, const std::filesystem::path &destPath,
                     Error *outError = nullptr) const;

  // Checksum the stored bytes of one entry without decompressing
  bool verify(const Entry &entry, Error *outError = nullptr) const;

  // Checksum every entry; `deep` also inflates each one and compares its MD5
  VerifyReport verifyAll(bool deep = false) const;

  bool isOpen() const { return source_ != nullptr; }

  void close();

private:
  bool parse(Error *outError);
  bool readStored(const Entry &entry, std::vector<uint8_t> &out, Error *outError) const;

  const ByteSource *source_ = nullptr;
  Header header_;
  OrderedMap<uint32_t, Entry> entries_; // name hash -> entry
};

} // namespace tre
