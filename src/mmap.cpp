#include <cstring>
#include <format>
#include <system_error>

#include <tre/log.hpp>
#include <tre/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace tre {

namespace {

#ifdef _WIN32
std::string lastSystemError() {
  return std::system_category().message(static_cast<int>(GetLastError()));
}
#else
std::string lastSystemError() {
  return std::generic_category().message(errno);
}
#endif

bool ioFailure(Error *outError, const std::string &what, const std::filesystem::path &path) {
  std::string message = std::format("{}: {} ({})", what, path.string(), lastSystemError());
  TRE_LOG_DEBUG("{}", message);
  return detail::fail(outError, ErrorCode::IoError, std::move(message));
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_), writable_(other.writable_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
  other.writable_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    writable_ = other.writable_;
    other.data_ = nullptr;
    other.size_ = 0;
    other.writable_ = false;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return ioFailure(outError, "Failed to open archive", path);
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    bool result = ioFailure(outError, "Failed to get file size", path);
    close();
    return result;
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    return ioFailure(outError, "Failed to open archive", path);
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    bool result = ioFailure(outError, "Failed to get file size", path);
    close();
    return result;
  }
  size_ = static_cast<size_t>(st.st_size);
#endif

  // Zero-length mappings are invalid on every platform
  if (size_ == 0) {
    close();
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("File is empty: {}", path.string()));
  }

#ifdef _WIN32
  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    bool result = ioFailure(outError, "Failed to map archive", path);
    close();
    return result;
  }
#else
  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    bool result = ioFailure(outError, "Failed to map archive", path);
    close();
    return result;
  }
#endif

  writable_ = false;
  TRE_LOG_TRACE("Mapped {} ({} bytes)", path.string(), size_);
  return true;
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  if (size == 0) {
    return detail::fail(outError, ErrorCode::IoError, "Cannot create file mapping with zero size");
  }

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    return ioFailure(outError, "Failed to create output file", path);
  }

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(static_cast<HANDLE>(fileHandle_), fileSize, nullptr, FILE_BEGIN) ||
      !SetEndOfFile(static_cast<HANDLE>(fileHandle_))) {
    bool result = ioFailure(outError, "Failed to set file size", path);
    close();
    return result;
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READWRITE, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_WRITE, 0, 0, 0);
  }
  if (!data_) {
    bool result = ioFailure(outError, "Failed to map output file", path);
    close();
    return result;
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd_ < 0) {
    return ioFailure(outError, "Failed to create output file", path);
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    bool result = ioFailure(outError, "Failed to set file size", path);
    close();
    return result;
  }

  data_ = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    bool result = ioFailure(outError, "Failed to map output file", path);
    close();
    return result;
  }
#endif

  size_ = size;
  writable_ = true;
  return true;
}

bool MappedFile::readAt(uint64_t offset, std::span<uint8_t> out, Error *outError) const {
  if (!data_) {
    return detail::fail(outError, ErrorCode::IoError, "Read from a closed mapping");
  }
  if (offset > size_ || out.size() > size_ - offset) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Read past end of file (offset={}, length={}, size={})",
                                    offset, out.size(), size_));
  }
  if (!out.empty()) {
    std::memcpy(out.data(), static_cast<const uint8_t *>(data_) + offset, out.size());
  }
  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!data_ || !writable_) {
    return detail::fail(outError, ErrorCode::IoError, "Cannot flush: file not open or not writable");
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to flush mapped file ({})", lastSystemError()));
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Failed to sync mapped file ({})", lastSystemError()));
  }
#endif

  return true;
}

void MappedFile::close() {
  cleanup();
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

} // namespace tre
