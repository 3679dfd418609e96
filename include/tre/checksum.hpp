#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "error.hpp"
#include "types.hpp"

namespace tre {

// CRC-32 (zlib) over stored bytes; checked on every extraction
uint32_t fastChecksum(std::span<const uint8_t> data);

// MD5 over uncompressed bytes; identifies identical payloads during builds.
// Fails with DigestError if the crypto library refuses MD5 (e.g. a FIPS-only provider).
std::optional<ContentHash> contentHash(std::span<const uint8_t> data, Error *outError = nullptr);

// Lowercase, forward-slash form of an archive path, used for lookup
std::string normalizePath(std::string_view path);

// CRC-32/BZIP2 of the normalized name
uint32_t nameHash(std::string_view name);

std::string toHex(const ContentHash &hash);

} // namespace tre
