#include <algorithm>
#include <format>
#include <fstream>

#include <tre/checksum.hpp>
#include <tre/compression.hpp>
#include <tre/entry_index.hpp>
#include <tre/log.hpp>
#include <tre/name_table.hpp>
#include <tre/reader.hpp>

namespace tre {

namespace {

bool regionInside(uint64_t offset, uint64_t length, uint64_t total) {
  return offset <= total && length <= total - offset;
}

void attachEntry(Error *outError, const Entry &entry, uint64_t offset) {
  if (outError) {
    outError->entryName = entry.name;
    outError->nameHash = entry.nameHash;
    outError->offset = offset;
  }
}

} // namespace

std::optional<Reader> Reader::open(const ByteSource &source, Error *outError) {
  Reader reader;
  reader.source_ = &source;

  if (!reader.parse(outError)) {
    if (outError) {
      TRE_LOG_WARN("Failed to open archive: {}", outError->toString());
    }
    return std::nullopt;
  }

  TRE_LOG_DEBUG("Opened archive: {} entries, {} data bytes", reader.entryCount(),
                reader.header_.dataSize);
  return reader;
}

bool Reader::parse(Error *outError) {
  const uint64_t sourceSize = source_->size();

  std::vector<uint8_t> headerBytes;
  uint64_t headerLength = std::min<uint64_t>(sourceSize, Header::headerSize);
  if (!source_->read(0, headerLength, headerBytes, outError)) {
    return false;
  }

  auto header = decodeHeader(headerBytes, outError);
  if (!header) {
    return false;
  }
  header_ = *header;

  // Every table must lie inside the source
  if (!regionInside(header_.indexOffset, header_.indexSize(), sourceSize)) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("Index of {} records at offset {} extends beyond file (size: {})",
                             header_.entryCount, header_.indexOffset, sourceSize));
    if (outError) {
      outError->offset = header_.indexOffset;
    }
    return false;
  }

  if (!regionInside(header_.nameOffset, header_.nameStoredSize, sourceSize)) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("Name table at offset {} (size {}) extends beyond file (size: {})",
                             header_.nameOffset, header_.nameStoredSize, sourceSize));
    if (outError) {
      outError->offset = header_.nameOffset;
    }
    return false;
  }

  if (!regionInside(header_.dataOffset, header_.dataSize, sourceSize)) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("Data section at offset {} (size {}) extends beyond file (size: {})",
                             header_.dataOffset, header_.dataSize, sourceSize));
    if (outError) {
      outError->offset = header_.dataOffset;
    }
    return false;
  }

  // Guards the name table allocation against a forged header
  uint64_t maxNameSize = static_cast<uint64_t>(header_.entryCount) * (6 + kMaxNameLength);
  if (header_.nameSize > maxNameSize) {
    return detail::fail(outError, ErrorCode::CorruptIndex,
                        std::format("Name table size {} is too large for {} entries",
                                    header_.nameSize, header_.entryCount));
  }

  if (header_.nameSize > maxDecodedSize(header_.nameCompression, header_.nameStoredSize)) {
    return detail::fail(outError, ErrorCode::CorruptIndex,
                        std::format("Name table of {} stored bytes cannot expand to {} bytes",
                                    header_.nameStoredSize, header_.nameSize));
  }

  std::vector<uint8_t> indexBytes;
  if (!source_->read(header_.indexOffset, header_.indexSize(), indexBytes, outError)) {
    return false;
  }

  auto entries = decodeIndex(indexBytes, header_.entryCount, header_.dataSize, outError);
  if (!entries) {
    if (outError) {
      outError->offset += header_.indexOffset;
    }
    return false;
  }

  std::vector<uint8_t> nameBytes;
  if (!source_->read(header_.nameOffset, header_.nameStoredSize, nameBytes, outError)) {
    return false;
  }

  auto names = decodeNameTable(nameBytes, header_.nameCompression, header_.nameSize, *entries,
                               outError);
  if (!names) {
    return false;
  }

  entries_.reserve(entries->size());
  for (auto &entry : *entries) {
    entry.name = std::move(names->at(entry.nameHash));
    TRE_LOG_TRACE("Entry {} ({} bytes, {} stored, {})", entry.name, entry.size, entry.storedSize,
                  compressionMethodName(entry.method));
    uint32_t hash = entry.nameHash;
    entries_.insert(hash, std::move(entry));
  }

  return true;
}

const Entry *Reader::entryAt(size_t index) const {
  if (index >= entries_.size()) {
    return nullptr;
  }
  return &entries_.at(index);
}

const Entry *Reader::findEntry(std::string_view name) const {
  return entries_.find(nameHash(name));
}

const Entry *Reader::findEntryByHash(uint32_t hash) const {
  return entries_.find(hash);
}

uint64_t Reader::totalUncompressedSize() const {
  uint64_t total = 0;
  for (const auto &entry : entries_) {
    total += entry.size;
  }
  return total;
}

bool Reader::readStored(const Entry &entry, std::vector<uint8_t> &out, Error *outError) const {
  if (!source_) {
    return detail::fail(outError, ErrorCode::IoError, "Archive is not open");
  }

  uint64_t offset = header_.dataOffset + entry.offset;
  if (!source_->read(offset, entry.storedSize, out, outError)) {
    attachEntry(outError, entry, offset);
    return false;
  }

  uint32_t actual = fastChecksum(out);
  if (actual != entry.checksum) {
    detail::fail(outError, ErrorCode::ChecksumMismatch,
                 std::format("Checksum mismatch for {} (expected={:08x}, actual={:08x})",
                             entry.name, entry.checksum, actual));
    attachEntry(outError, entry, offset);
    if (outError) {
      outError->expectedChecksum = entry.checksum;
      outError->actualChecksum = actual;
    }
    TRE_LOG_WARN("Checksum mismatch for {} at offset {}", entry.name, offset);
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> Reader::extract(const Entry &entry, Error *outError) const {
  std::vector<uint8_t> stored;
  if (!readStored(entry, stored, outError)) {
    return std::nullopt;
  }

  auto data = decompress(entry.method, stored, entry.size, outError);
  if (!data) {
    attachEntry(outError, entry, header_.dataOffset + entry.offset);
    return std::nullopt;
  }

  return data;
}

std::optional<std::vector<uint8_t>> Reader::extract(std::string_view name,
                                                    Error *outError) const {
  const Entry *entry = findEntry(name);
  if (!entry) {
    detail::fail(outError, ErrorCode::EntryNotFound, std::format("No entry named {}", name));
    if (outError) {
      outError->entryName = std::string(name);
      outError->nameHash = nameHash(name);
    }
    return std::nullopt;
  }
  return extract(*entry, outError);
}

std::optional<std::vector<uint8_t>> Reader::extractByHash(uint32_t hash, Error *outError) const {
  const Entry *entry = findEntryByHash(hash);
  if (!entry) {
    detail::fail(outError, ErrorCode::EntryNotFound,
                 std::format("No entry with name hash {:08x}", hash));
    if (outError) {
      outError->nameHash = hash;
    }
    return std::nullopt;
  }
  return extract(*entry, outError);
}

std::optional<std::vector<uint8_t>> Reader::extractAt(size_t index, Error *outError) const {
  const Entry *entry = entryAt(index);
  if (!entry) {
    detail::fail(outError, ErrorCode::EntryNotFound,
                 std::format("No entry at index {} (count: {})", index, entries_.size()));
    return std::nullopt;
  }
  return extract(*entry, outError);
}

bool Reader::extractToFile(const Entry &entry, const std::filesystem::path &destPath,
                           Error *outError) const {
  auto data = extract(entry, outError);
  if (!data) {
    return false;
  }

  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      return detail::fail(outError, ErrorCode::IoError,
                          std::format("Failed to create directory {}: {}",
                                      destPath.parent_path().string(), ec.message()));
    }
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to create output file: {}", destPath.string()));
  }

  out.write(reinterpret_cast<const char *>(data->data()),
            static_cast<std::streamsize>(data->size()));
  if (!out) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to write to output file: {}", destPath.string()));
  }

  return true;
}

bool Reader::verify(const Entry &entry, Error *outError) const {
  std::vector<uint8_t> stored;
  return readStored(entry, stored, outError);
}

VerifyReport Reader::verifyAll(bool deep) const {
  VerifyReport report;

  for (const auto &entry : entries_) {
    ++report.checked;
    Error error;

    if (!deep) {
      if (!verify(entry, &error)) {
        report.failures.push_back(std::move(error));
      }
      continue;
    }

    auto data = extract(entry, &error);
    if (!data) {
      report.failures.push_back(std::move(error));
      continue;
    }

    auto digest = contentHash(*data, &error);
    if (!digest) {
      attachEntry(&error, entry, header_.dataOffset + entry.offset);
      report.failures.push_back(std::move(error));
      continue;
    }

    if (*digest != entry.contentHash) {
      detail::fail(&error, ErrorCode::ContentMismatch,
                   std::format("Content hash mismatch for {} (expected {})", entry.name,
                               toHex(entry.contentHash)));
      attachEntry(&error, entry, header_.dataOffset + entry.offset);
      report.failures.push_back(std::move(error));
    }
  }

  TRE_LOG_DEBUG("Verified {} entries, {} failures", report.checked, report.failures.size());
  return report;
}

void Reader::close() {
  source_ = nullptr;
  header_ = Header{};
  entries_.clear();
}

} // namespace tre
