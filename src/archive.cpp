#include <cstring>
#include <format>

#include <tre/archive.hpp>
#include <tre/log.hpp>
#include <tre/mmap.hpp>
#include <tre/reader.hpp>

namespace tre {

namespace {

bool notWriting(Error *outError) {
  return detail::fail(outError, ErrorCode::InvalidState, "Archive not open for writing");
}

bool notReading(Error *outError) {
  return detail::fail(outError, ErrorCode::InvalidState, "Archive not open for reading");
}

} // namespace

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  auto file = std::make_unique<MappedFile>();
  if (!file->openRead(path, outError)) {
    return std::nullopt;
  }

  auto reader = Reader::open(*file, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.file_ = std::move(file);
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

Archive Archive::create(BuilderOptions options) {
  Archive archive;
  archive.builder_ = std::make_unique<Builder>(options);
  return archive;
}

bool Archive::addFile(const std::filesystem::path &sourcePath, std::string_view archivePath,
                      Error *outError) {
  if (!builder_) {
    return notWriting(outError);
  }
  return builder_->addFile(sourcePath, archivePath, outError);
}

bool Archive::addFile(std::span<const uint8_t> data, std::string_view archivePath,
                      Error *outError) {
  if (!builder_) {
    return notWriting(outError);
  }
  return builder_->addFile(data, archivePath, outError);
}

bool Archive::removeFile(std::string_view archivePath, Error *outError) {
  if (!builder_) {
    return notWriting(outError);
  }
  return builder_->removeFile(archivePath, outError);
}

bool Archive::write(const std::filesystem::path &destPath, Error *outError) {
  if (!builder_) {
    return notWriting(outError);
  }

  if (!finalized_) {
    finalized_ = builder_->finalize(outError);
    if (!finalized_) {
      return false;
    }
  }

  std::filesystem::path tempPath = destPath;
  tempPath += ".tmp";

  {
    MappedFile output;
    if (!output.openWrite(tempPath, finalized_->size(), outError)) {
      std::error_code ignored;
      std::filesystem::remove(tempPath, ignored);
      return false;
    }

    std::memcpy(output.data().data(), finalized_->data(), finalized_->size());

    if (!output.flush(outError)) {
      output.close();
      std::error_code ignored;
      std::filesystem::remove(tempPath, ignored);
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tempPath, destPath, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tempPath, ignored);
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to move {} into place: {}", destPath.string(),
                                    ec.message()));
  }

  TRE_LOG_INFO("Wrote {} ({} entries, {} bytes)", destPath.string(), builder_->entryCount(),
               finalized_->size());
  return true;
}

std::span<const Entry> Archive::entries() const {
  if (reader_) {
    return reader_->entries();
  }
  return {};
}

size_t Archive::entryCount() const {
  if (reader_) {
    return reader_->entryCount();
  }
  if (builder_) {
    return builder_->entryCount();
  }
  return 0;
}

const Entry *Archive::findEntry(std::string_view archivePath) const {
  if (!reader_) {
    return nullptr;
  }
  return reader_->findEntry(archivePath);
}

std::optional<std::vector<uint8_t>> Archive::extract(const Entry &entry, Error *outError) const {
  if (!reader_) {
    notReading(outError);
    return std::nullopt;
  }
  return reader_->extract(entry, outError);
}

bool Archive::extractToFile(const Entry &entry, const std::filesystem::path &destPath,
                            Error *outError) const {
  if (!reader_) {
    return notReading(outError);
  }
  return reader_->extractToFile(entry, destPath, outError);
}

VerifyReport Archive::verifyAll(bool deep) const {
  if (!reader_) {
    VerifyReport report;
    Error error;
    notReading(&error);
    report.failures.push_back(std::move(error));
    return report;
  }
  return reader_->verifyAll(deep);
}

void Archive::close() {
  reader_.reset();
  file_.reset();
  builder_.reset();
  finalized_.reset();
}

} // namespace tre
