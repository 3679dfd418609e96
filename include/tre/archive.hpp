#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "builder.hpp"
#include "error.hpp"
#include "types.hpp"

namespace tre {

// Forward declarations
class MappedFile;
class Reader;

// File-level archive interface combining reading and writing
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Map an existing archive and parse it
  // Returns std::nullopt on failure, with the reason in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &path, Error *outError = nullptr);

  // Start a new archive
  static Archive create(BuilderOptions options = {});

  // Add file to archive (from disk)
  bool addFile(const std::filesystem::path &sourcePath, std::string_view archivePath,
               Error *outError = nullptr);

  // Add file to archive (from memory)
  bool addFile(std::span<const uint8_t> data, std::string_view archivePath,
               Error *outError = nullptr);

  bool removeFile(std::string_view archivePath, Error *outError = nullptr);

  // Finalize and write to destPath through a temporary file renamed into place.
  // On failure destPath is left untouched; a failed write may be retried.
  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  // Entries of an archive opened for reading (empty when writing)
  std::span<const Entry> entries() const;

  size_t entryCount() const;

  // Case-insensitive lookup (only available when reading)
  const Entry *findEntry(std::string_view archivePath) const;

  std::optional<std::vector<uint8_t>> extract(const Entry &entry, Error *outError = nullptr) const;

  bool extractToFile(const Entry &entry, const std::filesystem::path &destPath,
                     Error *outError = nullptr) const;

  // Only available when reading
  VerifyReport verifyAll(bool deep = false) const;

  // Underlying reader, nullptr unless reading
  const Reader *reader() const { return reader_.get(); }

  bool isReading() const { return reader_.get() != nullptr; }

  bool isWriting() const { return builder_.get() != nullptr; }

  bool isOpen() const { return isReading() || isWriting(); }

  void close();

private:
  // The reader borrows file_, so file_ is declared first and destroyed last
  std::unique_ptr<MappedFile> file_;
  std::unique_ptr<Reader> reader_;
  std::unique_ptr<Builder> builder_;
  std::optional<std::vector<uint8_t>> finalized_; // Kept until written successfully
};

} // namespace tre
