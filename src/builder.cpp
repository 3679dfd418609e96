#include <format>
#include <fstream>
#include <map>
#include <utility>

#include <tre/builder.hpp>
#include <tre/checksum.hpp>
#include <tre/compression.hpp>
#include <tre/entry_index.hpp>
#include <tre/header.hpp>
#include <tre/log.hpp>
#include <tre/name_table.hpp>
#include <tre/reader.hpp>

namespace tre {

namespace {

bool finalizedError(Error *outError, std::string_view operation) {
  return detail::fail(outError, ErrorCode::InvalidState,
                      std::format("Cannot {}: archive already finalized", operation));
}

std::optional<Compressed> encodePayload(std::span<const uint8_t> data,
                                        const BuilderOptions &options, Error *outError) {
  switch (options.compression) {
  case CompressionPolicy::Store:
    return compressWith(CompressionMethod::Store, data, options.compressionLevel, outError);
  case CompressionPolicy::Deflate:
    return compressWith(CompressionMethod::Deflate, data, options.compressionLevel, outError);
  case CompressionPolicy::Auto:
    break;
  }
  return compress(data, options.compressionLevel, outError);
}

} // namespace

bool Builder::addFile(std::span<const uint8_t> data, std::string_view name, Error *outError) {
  if (finalized_) {
    return finalizedError(outError, "add file");
  }

  if (name.empty() || name.size() > kMaxNameLength) {
    detail::fail(outError, ErrorCode::InvalidName,
                 std::format("Invalid entry name length {} (allowed: 1..{})", name.size(),
                             kMaxNameLength));
    if (outError) {
      outError->entryName = std::string(name);
    }
    return false;
  }

  uint32_t hash = nameHash(name);
  if (const PendingFile *existing = pending_.find(hash)) {
    detail::fail(outError, ErrorCode::DuplicateEntryName,
                 std::format("Duplicate entry name in archive: {} (collides with {})", name,
                             existing->name));
    if (outError) {
      outError->entryName = std::string(name);
      outError->nameHash = hash;
    }
    return false;
  }

  PendingFile pending;
  pending.name = std::string(name);
  pending.nameHash = hash;
  auto digest = contentHash(data, outError);
  if (!digest) {
    if (outError) {
      outError->entryName = pending.name;
    }
    return false;
  }
  pending.contentHash = *digest;
  pending.data.assign(data.begin(), data.end());

  TRE_LOG_TRACE("Added {} ({} bytes, md5 {})", pending.name, pending.data.size(),
                toHex(pending.contentHash));
  pending_.insert(hash, std::move(pending));
  return true;
}

bool Builder::addFile(const std::filesystem::path &sourcePath, std::string_view name,
                      Error *outError) {
  if (finalized_) {
    return finalizedError(outError, "add file");
  }

  std::ifstream in(sourcePath, std::ios::binary | std::ios::ate);
  if (!in) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to open source file: {}", sourcePath.string()));
  }

  std::streamoff fileSize = in.tellg();
  if (fileSize < 0) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to get file size: {}", sourcePath.string()));
  }
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(fileSize));
  if (!data.empty() &&
      !in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(fileSize))) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to read source file: {}", sourcePath.string()));
  }

  return addFile(std::span<const uint8_t>(data), name, outError);
}

bool Builder::merge(const Reader &reader, Error *outError) {
  if (finalized_) {
    return finalizedError(outError, "merge");
  }

  for (const auto &entry : reader.entries()) {
    auto data = reader.extract(entry, outError);
    if (!data) {
      return false;
    }
    if (!addFile(std::span<const uint8_t>(*data), entry.name, outError)) {
      return false;
    }
  }

  return true;
}

bool Builder::removeFile(std::string_view name, Error *outError) {
  if (finalized_) {
    return finalizedError(outError, "remove file");
  }
  if (pending_.empty()) {
    return detail::fail(outError, ErrorCode::InvalidState, "Cannot remove file: archive is empty");
  }

  uint32_t hash = nameHash(name);
  if (!pending_.erase(hash)) {
    detail::fail(outError, ErrorCode::EntryNotFound, std::format("No entry named {}", name));
    if (outError) {
      outError->entryName = std::string(name);
      outError->nameHash = hash;
    }
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> Builder::finalize(Error *outError) {
  if (finalized_) {
    finalizedError(outError, "finalize");
    return std::nullopt;
  }

  // Step 1: compress payloads and lay out the data section in insertion order
  std::vector<Entry> entries;
  entries.reserve(pending_.size());
  std::vector<Compressed> blocks;
  blocks.reserve(pending_.size());
  std::map<std::pair<ContentHash, uint64_t>, size_t> blockByContent;
  uint64_t dataSize = 0;

  for (const auto &pending : pending_) {
    Entry entry;
    entry.name = pending.name;
    entry.nameHash = pending.nameHash;
    entry.size = pending.data.size();
    entry.contentHash = pending.contentHash;

    auto key = std::make_pair(pending.contentHash, entry.size);
    auto shared = options_.deduplicate ? blockByContent.find(key) : blockByContent.end();
    if (shared != blockByContent.end()) {
      const Entry &owner = entries[shared->second];
      entry.method = owner.method;
      entry.checksum = owner.checksum;
      entry.storedSize = owner.storedSize;
      entry.offset = owner.offset;
      TRE_LOG_TRACE("{} shares its data block with {}", entry.name, owner.name);
      entries.push_back(std::move(entry));
      continue;
    }

    auto block = encodePayload(pending.data, options_, outError);
    if (!block) {
      if (outError) {
        outError->entryName = pending.name;
        outError->nameHash = pending.nameHash;
      }
      return std::nullopt;
    }
    entry.method = block->method;
    entry.checksum = fastChecksum(block->bytes);
    entry.storedSize = block->bytes.size();
    entry.offset = dataSize;
    dataSize += block->bytes.size();

    blockByContent.emplace(key, entries.size());
    entries.push_back(std::move(entry));
    blocks.push_back(std::move(*block));
  }

  // Step 2: index and name table
  std::vector<uint8_t> index = encodeIndex(entries);
  auto names = encodeNameTable(entries, options_.nameTableCompressionThreshold,
                               options_.compressionLevel, outError);
  if (!names) {
    return std::nullopt;
  }

  // Step 3: header
  Header header;
  header.entryCount = static_cast<uint32_t>(entries.size());
  header.nameCompression = names->method;
  header.indexOffset = Header::headerSize;
  header.nameOffset = header.indexOffset + index.size();
  header.nameStoredSize = names->bytes.size();
  header.nameSize = names->rawSize;
  header.dataOffset = header.nameOffset + names->bytes.size();
  header.dataSize = dataSize;

  // Step 4: emit everything contiguously
  std::vector<uint8_t> out = encodeHeader(header);
  out.reserve(static_cast<size_t>(header.dataOffset + dataSize));
  out.insert(out.end(), index.begin(), index.end());
  out.insert(out.end(), names->bytes.begin(), names->bytes.end());
  for (const auto &block : blocks) {
    out.insert(out.end(), block.bytes.begin(), block.bytes.end());
  }

  // Payloads are no longer needed once serialized
  for (size_t i = 0; i < pending_.size(); ++i) {
    pending_.at(i).data = {};
  }
  finalized_ = true;

  TRE_LOG_DEBUG("Finalized archive: {} entries, {} data blocks, {} bytes", entries.size(),
                blocks.size(), out.size());
  return out;
}

BuilderState Builder::state() const {
  if (finalized_) {
    return BuilderState::Finalized;
  }
  return pending_.empty() ? BuilderState::Empty : BuilderState::Accumulating;
}

bool Builder::contains(std::string_view name) const {
  return pending_.contains(nameHash(name));
}

} // namespace tre
