#include <cstring>
#include <format>

#include <tre/byte_source.hpp>

namespace tre {

bool ByteSource::read(uint64_t offset, uint64_t length, std::vector<uint8_t> &out,
                      Error *outError) const {
  if (offset > size() || length > size() - offset) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Read past end of source (offset={}, length={}, size={})",
                                    offset, length, size()));
  }
  out.resize(static_cast<size_t>(length));
  return readAt(offset, out, outError);
}

bool MemorySource::readAt(uint64_t offset, std::span<uint8_t> out, Error *outError) const {
  if (offset > data_.size() || out.size() > data_.size() - offset) {
    return detail::fail(outError, ErrorCode::IoError,
                        std::format("Read past end of buffer (offset={}, length={}, size={})",
                                    offset, out.size(), data_.size()));
  }
  if (!out.empty()) {
    std::memcpy(out.data(), data_.data() + offset, out.size());
  }
  return true;
}

} // namespace tre
