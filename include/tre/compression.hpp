#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace tre {

// Result of compressing one payload
struct Compressed {
  CompressionMethod method = CompressionMethod::Store;
  std::vector<uint8_t> bytes;
};

std::string_view compressionMethodName(CompressionMethod method) noexcept;

// Deflate the payload, falling back to Store when that does not make it smaller.
// Fails with CompressionError only if zlib cannot set up its stream.
std::optional<Compressed> compress(std::span<const uint8_t> data, int level,
                                   Error *outError = nullptr);

// Encode with a fixed method, regardless of the resulting size
std::optional<Compressed> compressWith(CompressionMethod method, std::span<const uint8_t> data,
                                       int level, Error *outError = nullptr);

// Invert compress(). Fails with CompressionError on an unknown method, a malformed
// stream, or an output length different from expectedSize.
std::optional<std::vector<uint8_t>> decompress(CompressionMethod method,
                                               std::span<const uint8_t> stored,
                                               uint64_t expectedSize, Error *outError = nullptr);

// Largest size `storedSize` bytes of `method` can decode to. Deflate expands at
// most 1032:1; UINT64_MAX for an unknown method.
uint64_t maxDecodedSize(CompressionMethod method, uint64_t storedSize) noexcept;

namespace detail {

// zlib counts in uInt, so streams are fed in pieces no larger than this
inline constexpr size_t kZlibChunk = UINT_MAX;

std::optional<std::vector<uint8_t>> deflateChunked(std::span<const uint8_t> data, int level,
                                                   size_t chunk, Error *outError);

bool inflateChunked(std::span<const uint8_t> stored, uint64_t expectedSize,
                    std::vector<uint8_t> &out, size_t chunk, Error *outError);

} // namespace detail

} // namespace tre
