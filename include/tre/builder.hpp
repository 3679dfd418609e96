#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "ordered_map.hpp"
#include "types.hpp"

namespace tre {

class Reader;

enum class CompressionPolicy {
  Auto,    // Deflate unless that does not make the payload smaller
  Store,   // Never compress entries
  Deflate, // Always deflate entries
};

struct BuilderOptions {
  CompressionPolicy compression = CompressionPolicy::Auto;

  // zlib level; -1 selects zlib's default
  int compressionLevel = -1;

  // Raw name table size above which the table is deflated
  size_t nameTableCompressionThreshold = 1024;

  // Entries with identical content share a single data block
  bool deduplicate = true;
};

enum class BuilderState { Empty, Accumulating, Finalized };

// Write side of a TRE archive.
//
// Entries are kept in insertion order and serialized by finalize(), which
// produces byte-identical output for identical sequences of calls. A Builder
// is single-writer; share it across threads only under external locking.
class Builder {
public:
  Builder() = default;
  explicit Builder(BuilderOptions options) : options_(options) {}
  ~Builder() = default;

  // Delete copy, enable move
  Builder(const Builder &) = delete;
  Builder &operator=(const Builder &) = delete;
  Builder(Builder &&) noexcept = default;
  Builder &operator=(Builder &&) noexcept = default;

  // Add an entry from memory. Fails with DuplicateEntryName if the name hash is
  // taken (names compare case-insensitively), InvalidName, or InvalidState.
  bool addFile(std::span<const uint8_t> data, std::string_view name, Error *outError = nullptr);

  // Add an entry from disk; the file is read immediately
  bool addFile(const std::filesystem::path &sourcePath, std::string_view name,
               Error *outError = nullptr);

  // Copy every entry of an opened archive, in its index order
  bool merge(const Reader &reader, Error *outError = nullptr);

  // Only valid while accumulating
  bool removeFile(std::string_view name, Error *outError = nullptr);

  // Serialize Header + Index + NameTable + Data. The builder is Finalized afterwards.
  std::optional<std::vector<uint8_t>> finalize(Error *outError = nullptr);

  BuilderState state() const;

  size_t entryCount() const { return pending_.size(); }

  bool contains(std::string_view name) const;

  const BuilderOptions &options() const { return options_; }

private:
  struct PendingFile {
    std::string name;       // Verbatim, as given to addFile
    uint32_t nameHash = 0;
    ContentHash contentHash{};
    std::vector<uint8_t> data;
  };

  BuilderOptions options_;
  OrderedMap<uint32_t, PendingFile> pending_; // name hash -> pending file
  bool finalized_ = false;
};

} // namespace tre
