#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "error.hpp"

namespace tre {

// Random-access, read-only bytes backing an archive.
// readAt() must not change observable state, so that one source can serve
// concurrent readers.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual uint64_t size() const = 0;

  // Fill `out` with the bytes at [offset, offset + out.size()).
  // Fails with IoError if the range is not entirely inside the source.
  virtual bool readAt(uint64_t offset, std::span<uint8_t> out,
                      Error *outError = nullptr) const = 0;

  // Convenience wrapper allocating the result
  bool read(uint64_t offset, uint64_t length, std::vector<uint8_t> &out,
            Error *outError = nullptr) const;
};

// Non-owning view over bytes already in memory (e.g. a finalized archive)
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::span<const uint8_t> data) : data_(data) {}

  uint64_t size() const override { return data_.size(); }

  bool readAt(uint64_t offset, std::span<uint8_t> out, Error *outError = nullptr) const override;

  std::span<const uint8_t> data() const { return data_; }

private:
  std::span<const uint8_t> data_;
};

} // namespace tre
