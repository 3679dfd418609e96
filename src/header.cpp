#include <cstring>
#include <format>
#include <string_view>

#include <tre/byte_cursor.hpp>
#include <tre/header.hpp>

namespace tre {

namespace {

void encodeVersion(uint32_t version, uint8_t out[4]) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>('0' + version % 10);
    version /= 10;
  }
}

std::optional<uint32_t> decodeVersion(const uint8_t raw[4]) {
  uint32_t version = 0;
  for (int i = 3; i >= 0; --i) {
    if (raw[i] < '0' || raw[i] > '9') {
      return std::nullopt;
    }
    version = version * 10 + static_cast<uint32_t>(raw[i] - '0');
  }
  return version;
}

} // namespace

std::vector<uint8_t> encodeHeader(const Header &header) {
  std::vector<uint8_t> out;
  out.reserve(Header::headerSize);
  ByteWriter writer(out);

  uint8_t version[4];
  encodeVersion(header.version, version);

  writer.bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(kMagic), 4));
  writer.bytes(version);
  writer.u32(header.entryCount);
  writer.u32(static_cast<uint32_t>(header.nameCompression));
  writer.u64(header.indexOffset);
  writer.u64(header.nameOffset);
  writer.u64(header.nameStoredSize);
  writer.u64(header.nameSize);
  writer.u64(header.dataOffset);
  writer.u64(header.dataSize);

  return out;
}

std::optional<Header> decodeHeader(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < Header::headerSize) {
    detail::fail(outError, ErrorCode::CorruptIndex,
                 std::format("File too small to be a TRE archive (size: {})", data.size()));
    return std::nullopt;
  }

  ByteReader reader(data.first(Header::headerSize));

  uint8_t magic[4];
  uint8_t version[4];
  reader.bytes(magic);
  reader.bytes(version);

  if (std::memcmp(magic, kMagic, 4) != 0) {
    detail::fail(outError, ErrorCode::InvalidMagic,
                 std::format("Invalid TRE magic (expected 'EERT', got '{}')",
                             std::string_view(reinterpret_cast<const char *>(magic), 4)));
    return std::nullopt;
  }

  auto parsedVersion = decodeVersion(version);
  if (!parsedVersion || *parsedVersion < kMinVersion || *parsedVersion > kMaxVersion) {
    detail::fail(outError, ErrorCode::UnsupportedVersion,
                 std::format("Unsupported TRE version '{}' (supported: {}..{})",
                             std::string_view(reinterpret_cast<const char *>(version), 4),
                             kMinVersion, kMaxVersion));
    return std::nullopt;
  }

  Header header;
  header.version = *parsedVersion;
  uint32_t nameCompression = 0;
  reader.u32(header.entryCount);
  reader.u32(nameCompression);
  reader.u64(header.indexOffset);
  reader.u64(header.nameOffset);
  reader.u64(header.nameStoredSize);
  reader.u64(header.nameSize);
  reader.u64(header.dataOffset);
  reader.u64(header.dataSize);
  header.nameCompression = static_cast<CompressionMethod>(nameCompression);

  return header;
}

} // namespace tre
