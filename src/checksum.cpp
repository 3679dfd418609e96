#include <array>
#include <climits>
#include <format>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <zlib.h>

#include <tre/checksum.hpp>

namespace tre {

namespace {

// MSB-first table for polynomial 0x04C11DB7
constexpr std::array<uint32_t, 256> makeBzip2Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t crc = i << 24;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 0x80000000u) ? (crc << 1) ^ 0x04C11DB7u : (crc << 1);
    }
    table[i] = crc;
  }
  return table;
}

constexpr auto kBzip2Table = makeBzip2Table();

} // namespace

uint32_t fastChecksum(std::span<const uint8_t> data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  const uint8_t *ptr = data.data();
  size_t remaining = data.size();

  // zlib takes uInt lengths
  while (remaining > 0) {
    uInt chunk = remaining > UINT_MAX ? UINT_MAX : static_cast<uInt>(remaining);
    crc = crc32(crc, ptr, chunk);
    ptr += chunk;
    remaining -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

std::optional<ContentHash> contentHash(std::span<const uint8_t> data, Error *outError) {
  ContentHash hash{};
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), hash.data(), &length, EVP_md5(), nullptr) != 1 ||
      length != hash.size()) {
    detail::fail(outError, ErrorCode::DigestError,
                 std::format("MD5 digest failed: {}",
                             ERR_error_string(ERR_get_error(), nullptr)));
    return std::nullopt;
  }
  return hash;
}

std::string normalizePath(std::string_view path) {
  std::string result;
  result.reserve(path.size());

  for (char c : path) {
    if (c == '\\') {
      result += '/';
    } else if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c - 'A' + 'a');
    } else {
      result += c;
    }
  }

  return result;
}

uint32_t nameHash(std::string_view name) {
  uint32_t crc = 0xFFFFFFFFu;
  for (char c : normalizePath(name)) {
    uint8_t byte = static_cast<uint8_t>(c);
    crc = (crc << 8) ^ kBzip2Table[((crc >> 24) ^ byte) & 0xFFu];
  }
  return crc ^ 0xFFFFFFFFu;
}

std::string toHex(const ContentHash &hash) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(hash.size() * 2);
  for (uint8_t b : hash) {
    out += digits[b >> 4];
    out += digits[b & 0x0F];
  }
  return out;
}

} // namespace tre
