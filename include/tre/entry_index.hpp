#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "error.hpp"
#include "types.hpp"

namespace tre {

// Serialize entries in the given order (names are not part of the index)
std::vector<uint8_t> encodeIndex(std::span<const Entry> entries);

// Parse exactly `count` records. Fails with CorruptIndex if the buffer is short,
// if a record points outside [0, dataSize), if its size cannot come from its stored
// bytes, or if two records share a name hash.
std::optional<std::vector<Entry>> decodeIndex(std::span<const uint8_t> data, uint32_t count,
                                              uint64_t dataSize, Error *outError = nullptr);

} // namespace tre
