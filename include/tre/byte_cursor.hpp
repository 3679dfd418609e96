#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace tre {

// Appends little-endian fields to a growing buffer
class ByteWriter {
public:
  explicit ByteWriter(std::vector<uint8_t> &out) : out_(out) {}

  void u16(uint16_t value) { put(value); }
  void u32(uint32_t value) { put(value); }
  void u64(uint64_t value) { put(value); }

  void bytes(std::span<const uint8_t> data) { out_.insert(out_.end(), data.begin(), data.end()); }

  void bytes(const std::string &data) {
    out_.insert(out_.end(), data.begin(), data.end());
  }

  size_t size() const { return out_.size(); }

private:
  // Least significant byte first, independent of host byte order
  template <typename T> void put(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      out_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
  }

  std::vector<uint8_t> &out_;
};

// Bounds-checked little-endian reads over a fixed buffer.
// Every read returns false (and consumes nothing) if the buffer is too short.
class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

  bool u16(uint16_t &value) { return get(value); }
  bool u32(uint32_t &value) { return get(value); }
  bool u64(uint64_t &value) { return get(value); }

  bool bytes(std::span<uint8_t> out) {
    if (remaining() < out.size()) {
      return false;
    }
    if (!out.empty()) {
      std::memcpy(out.data(), data_.data() + pos_, out.size());
    }
    pos_ += out.size();
    return true;
  }

  bool string(size_t length, std::string &out) {
    if (remaining() < length) {
      return false;
    }
    out.assign(reinterpret_cast<const char *>(data_.data() + pos_), length);
    pos_ += length;
    return true;
  }

  size_t position() const { return pos_; }
  size_t remaining() const { return data_.size() - pos_; }
  bool atEnd() const { return pos_ == data_.size(); }

private:
  template <typename T> bool get(T &value) {
    if (remaining() < sizeof(T)) {
      return false;
    }
    T result = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
      result |= static_cast<T>(static_cast<T>(data_[pos_ + i]) << (8 * i));
    }
    value = result;
    pos_ += sizeof(T);
    return true;
  }

  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

} // namespace tre
