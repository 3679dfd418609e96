#include <format>

#include <tre/error.hpp>

namespace tre {

std::string_view errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::IoError:
    return "IoError";
  case ErrorCode::InvalidMagic:
    return "InvalidMagic";
  case ErrorCode::UnsupportedVersion:
    return "UnsupportedVersion";
  case ErrorCode::CorruptIndex:
    return "CorruptIndex";
  case ErrorCode::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorCode::CompressionError:
    return "CompressionError";
  case ErrorCode::DuplicateEntryName:
    return "DuplicateEntryName";
  case ErrorCode::EntryNotFound:
    return "EntryNotFound";
  case ErrorCode::InvalidName:
    return "InvalidName";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::ContentMismatch:
    return "ContentMismatch";
  case ErrorCode::DigestError:
    return "DigestError";
  }
  return "Unknown";
}

std::string Error::toString() const {
  return std::format("{}: {}", errorCodeName(code), message);
}

} // namespace tre
