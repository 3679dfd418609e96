#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tre {

enum class ErrorCode {
  IoError,
  InvalidMagic,
  UnsupportedVersion,
  CorruptIndex,
  ChecksumMismatch,
  CompressionError,
  DuplicateEntryName,
  EntryNotFound,
  InvalidName,
  InvalidState,
  ContentMismatch,
  DigestError,
};

// Stable identifier for an error code ("ChecksumMismatch", ...)
std::string_view errorCodeName(ErrorCode code) noexcept;

// Failure report filled through the `Error *outError` parameters of the API.
// Context fields are only meaningful when the failing operation knows them.
struct Error {
  ErrorCode code = ErrorCode::IoError;
  std::string message;

  std::string entryName;
  uint32_t nameHash = 0;
  uint64_t offset = 0;
  uint32_t expectedChecksum = 0;
  uint32_t actualChecksum = 0;

  std::string toString() const;
};

// Outcome of an integrity walk over every entry of an archive
struct VerifyReport {
  size_t checked = 0;
  std::vector<Error> failures;

  bool ok() const { return failures.empty(); }
};

namespace detail {

// Fill *outError (if any) and return false, for `return fail(...)` chains
inline bool fail(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    *outError = Error{};
    outError->code = code;
    outError->message = std::move(message);
  }
  return false;
}

} // namespace detail

} // namespace tre
