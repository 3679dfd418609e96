#include <algorithm>
#include <format>

#include <zlib.h>

#include <tre/compression.hpp>

namespace tre {

namespace detail {

std::optional<std::vector<uint8_t>> deflateChunked(std::span<const uint8_t> data, int level,
                                                   size_t chunk, Error *outError) {
  z_stream stream{};
  int ret = deflateInit(&stream, level);
  if (ret == Z_STREAM_ERROR) {
    // Out-of-range level; use the library default instead
    ret = deflateInit(&stream, Z_DEFAULT_COMPRESSION);
  }
  if (ret != Z_OK) {
    fail(outError, ErrorCode::CompressionError,
         std::format("deflateInit failed (zlib error {})", ret));
    return std::nullopt;
  }

  std::vector<uint8_t> out(data.size() / 2 + 64);
  size_t inPos = 0;
  size_t outPos = 0;

  while (true) {
    if (stream.avail_in == 0 && inPos < data.size()) {
      size_t piece = std::min(data.size() - inPos, chunk);
      stream.next_in = const_cast<Bytef *>(data.data() + inPos);
      stream.avail_in = static_cast<uInt>(piece);
      inPos += piece;
    }
    if (outPos == out.size()) {
      out.resize(out.size() * 2);
    }

    size_t room = std::min(out.size() - outPos, chunk);
    stream.next_out = out.data() + outPos;
    stream.avail_out = static_cast<uInt>(room);

    ret = deflate(&stream, inPos == data.size() ? Z_FINISH : Z_NO_FLUSH);
    outPos += room - stream.avail_out;

    if (ret == Z_STREAM_END) {
      break;
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      deflateEnd(&stream);
      fail(outError, ErrorCode::CompressionError,
           std::format("deflate failed (zlib error {})", ret));
      return std::nullopt;
    }
  }

  deflateEnd(&stream);
  out.resize(outPos);
  return out;
}

bool inflateChunked(std::span<const uint8_t> stored, uint64_t expectedSize,
                    std::vector<uint8_t> &out, size_t chunk, Error *outError) {
  if (expectedSize > maxDecodedSize(CompressionMethod::Deflate, stored.size())) {
    return fail(outError, ErrorCode::CompressionError,
                std::format("{} deflated bytes cannot expand to {} bytes", stored.size(),
                            expectedSize));
  }

  // One spare byte so that an oversized stream is detected instead of truncated
  out.resize(static_cast<size_t>(expectedSize) + 1);

  z_stream stream{};
  if (inflateInit(&stream) != Z_OK) {
    return fail(outError, ErrorCode::CompressionError, "inflateInit failed");
  }

  size_t inPos = 0;
  size_t outPos = 0;
  int ret = Z_OK;

  while (true) {
    if (stream.avail_in == 0 && inPos < stored.size()) {
      size_t piece = std::min(stored.size() - inPos, chunk);
      stream.next_in = const_cast<Bytef *>(stored.data() + inPos);
      stream.avail_in = static_cast<uInt>(piece);
      inPos += piece;
    }

    size_t room = std::min(out.size() - outPos, chunk);
    stream.next_out = out.data() + outPos;
    stream.avail_out = static_cast<uInt>(room);

    ret = inflate(&stream, Z_NO_FLUSH);
    outPos += room - stream.avail_out;

    if (ret == Z_STREAM_END) {
      break;
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      break;
    }

    // Stalled with nothing left to feed: truncated input or full output
    bool moreInput = stream.avail_in == 0 && inPos < stored.size();
    bool moreOutput = stream.avail_out == 0 && outPos < out.size();
    if (ret == Z_BUF_ERROR && !moreInput && !moreOutput) {
      break;
    }
  }

  size_t leftover = stream.avail_in + (stored.size() - inPos);
  inflateEnd(&stream);

  if (ret != Z_STREAM_END) {
    if (outPos > expectedSize) {
      return fail(outError, ErrorCode::CompressionError,
                  std::format("Decompressed size exceeds expected size {}", expectedSize));
    }
    return fail(outError, ErrorCode::CompressionError,
                std::format("Malformed deflate stream (zlib error {})", ret));
  }

  if (leftover != 0) {
    return fail(outError, ErrorCode::CompressionError,
                std::format("{} trailing bytes after deflate stream", leftover));
  }

  if (outPos != expectedSize) {
    return fail(outError, ErrorCode::CompressionError,
                std::format("Decompressed size mismatch (expected={}, actual={})", expectedSize,
                            outPos));
  }

  out.resize(static_cast<size_t>(expectedSize));
  return true;
}

} // namespace detail

std::string_view compressionMethodName(CompressionMethod method) noexcept {
  switch (method) {
  case CompressionMethod::Store:
    return "store";
  case CompressionMethod::Deflate:
    return "deflate";
  }
  return "unknown";
}

uint64_t maxDecodedSize(CompressionMethod method, uint64_t storedSize) noexcept {
  switch (method) {
  case CompressionMethod::Store:
    return storedSize;
  case CompressionMethod::Deflate:
    if (storedSize > (UINT64_MAX - 64) / 1032) {
      return UINT64_MAX;
    }
    return storedSize * 1032 + 64;
  }
  return UINT64_MAX;
}

std::optional<Compressed> compress(std::span<const uint8_t> data, int level, Error *outError) {
  Compressed result;
  if (!data.empty()) {
    auto deflated = detail::deflateChunked(data, level, detail::kZlibChunk, outError);
    if (!deflated) {
      return std::nullopt;
    }
    if (deflated->size() < data.size()) {
      result.method = CompressionMethod::Deflate;
      result.bytes = std::move(*deflated);
      return result;
    }
  }

  result.method = CompressionMethod::Store;
  result.bytes.assign(data.begin(), data.end());
  return result;
}

std::optional<Compressed> compressWith(CompressionMethod method, std::span<const uint8_t> data,
                                       int level, Error *outError) {
  if (method != CompressionMethod::Deflate) {
    Compressed result;
    result.bytes.assign(data.begin(), data.end());
    return result;
  }

  auto deflated = detail::deflateChunked(data, level, detail::kZlibChunk, outError);
  if (!deflated) {
    return std::nullopt;
  }
  Compressed result;
  result.method = CompressionMethod::Deflate;
  result.bytes = std::move(*deflated);
  return result;
}

std::optional<std::vector<uint8_t>> decompress(CompressionMethod method,
                                               std::span<const uint8_t> stored,
                                               uint64_t expectedSize, Error *outError) {
  std::vector<uint8_t> out;

  switch (method) {
  case CompressionMethod::Store:
    if (stored.size() != expectedSize) {
      detail::fail(outError, ErrorCode::CompressionError,
                   std::format("Stored block size mismatch (expected={}, actual={})",
                               expectedSize, stored.size()));
      return std::nullopt;
    }
    out.assign(stored.begin(), stored.end());
    return out;

  case CompressionMethod::Deflate:
    if (!detail::inflateChunked(stored, expectedSize, out, detail::kZlibChunk, outError)) {
      return std::nullopt;
    }
    return out;
  }

  detail::fail(outError, ErrorCode::CompressionError,
               std::format("Unknown compression method {}", static_cast<uint32_t>(method)));
  return std::nullopt;
}

} // namespace tre
