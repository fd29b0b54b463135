#include "blobfeed/avro/codec.hpp"

#include <string>

#include <zlib.h>

#ifdef BLOBFEED_HAS_ZSTD
#include <zstd.h>
#endif

namespace blobfeed::avro {

using core::error;
using core::error_code;

auto parse_codec(std::string_view name) -> std::expected<Codec, error> {
  if (name.empty() || name == "null") return Codec::null;
  if (name == "deflate") return Codec::deflate;
  if (name == "zstandard") {
#ifdef BLOBFEED_HAS_ZSTD
    return Codec::zstandard;
#else
    return std::unexpected(error{error_code::schema_mismatch, "zstandard codec not compiled in", "avro.codec"});
#endif
  }
  return std::unexpected(error{error_code::schema_mismatch,
                               "unsupported codec \"" + std::string(name) + "\"", "avro.codec"});
}

auto codec_name(Codec c) noexcept -> std::string_view {
  switch (c) {
    case Codec::null: return "null";
    case Codec::deflate: return "deflate";
    case Codec::zstandard: return "zstandard";
  }
  return "null";
}

namespace {

auto inflate_raw(std::span<const std::uint8_t> in, std::size_t max_output)
    -> std::expected<std::vector<std::uint8_t>, error> {
  z_stream strm{};
  if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
    return std::unexpected(error{error_code::internal, "inflateInit2 failed", "avro.codec"});
  }
  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
  strm.avail_in = static_cast<uInt>(in.size());

  std::vector<std::uint8_t> out;
  std::uint8_t chunk[16384];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    strm.next_out = chunk;
    strm.avail_out = sizeof(chunk);
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&strm);
      return std::unexpected(error{error_code::corrupt_block, "deflate stream invalid", "avro.codec"});
    }
    const std::size_t produced = sizeof(chunk) - strm.avail_out;
    if (out.size() + produced > max_output) {
      inflateEnd(&strm);
      return std::unexpected(error{error_code::corrupt_block, "inflated block exceeds limit", "avro.codec"});
    }
    out.insert(out.end(), chunk, chunk + produced);
    if (ret == Z_OK && strm.avail_in == 0 && produced == 0) {
      inflateEnd(&strm);
      return std::unexpected(error{error_code::corrupt_block, "deflate stream truncated", "avro.codec"});
    }
  }
  inflateEnd(&strm);
  return out;
}

auto deflate_raw(std::span<const std::uint8_t> in) -> std::expected<std::vector<std::uint8_t>, error> {
  z_stream strm{};
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return std::unexpected(error{error_code::internal, "deflateInit2 failed", "avro.codec"});
  }
  std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(in.size())));
  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
  strm.avail_in = static_cast<uInt>(in.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());
  const int ret = deflate(&strm, Z_FINISH);
  const std::size_t produced = out.size() - strm.avail_out;
  deflateEnd(&strm);
  if (ret != Z_STREAM_END) {
    return std::unexpected(error{error_code::internal, "deflate failed", "avro.codec"});
  }
  out.resize(produced);
  return out;
}

} // namespace

auto decompress(Codec c, std::span<const std::uint8_t> in, std::size_t max_output)
    -> std::expected<std::vector<std::uint8_t>, error> {
  switch (c) {
    case Codec::null:
      if (in.size() > max_output) {
        return std::unexpected(error{error_code::corrupt_block, "block exceeds limit", "avro.codec"});
      }
      return std::vector<std::uint8_t>(in.begin(), in.end());
    case Codec::deflate:
      return inflate_raw(in, max_output);
    case Codec::zstandard: {
#ifdef BLOBFEED_HAS_ZSTD
      const unsigned long long size = ZSTD_getFrameContentSize(in.data(), in.size());
      if (size == ZSTD_CONTENTSIZE_ERROR) {
        return std::unexpected(error{error_code::corrupt_block, "zstd frame invalid", "avro.codec"});
      }
      if (size != ZSTD_CONTENTSIZE_UNKNOWN) {
        if (size > max_output) {
          return std::unexpected(error{error_code::corrupt_block, "zstd block exceeds limit", "avro.codec"});
        }
        std::vector<std::uint8_t> out(static_cast<std::size_t>(size));
        const std::size_t got = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
        if (ZSTD_isError(got) || got != out.size()) {
          return std::unexpected(error{error_code::corrupt_block,
                                       std::string("zstd decompression failed: ") + ZSTD_getErrorName(got),
                                       "avro.codec"});
        }
        return out;
      }
      // Streaming frame without a declared size.
      ZSTD_DStream* ds = ZSTD_createDStream();
      if (ds == nullptr) return std::unexpected(error{error_code::resource_exhausted, "zstd stream alloc failed", "avro.codec"});
      ZSTD_initDStream(ds);
      std::vector<std::uint8_t> out;
      std::vector<std::uint8_t> chunk(ZSTD_DStreamOutSize());
      ZSTD_inBuffer ib{in.data(), in.size(), 0};
      std::size_t rc = 1;
      while (ib.pos < ib.size) {
        ZSTD_outBuffer ob{chunk.data(), chunk.size(), 0};
        rc = ZSTD_decompressStream(ds, &ob, &ib);
        if (ZSTD_isError(rc) || out.size() + ob.pos > max_output) {
          ZSTD_freeDStream(ds);
          return std::unexpected(error{error_code::corrupt_block, "zstd stream invalid", "avro.codec"});
        }
        out.insert(out.end(), chunk.data(), chunk.data() + ob.pos);
      }
      ZSTD_freeDStream(ds);
      if (rc != 0) return std::unexpected(error{error_code::corrupt_block, "zstd stream truncated", "avro.codec"});
      return out;
#else
      return std::unexpected(error{error_code::schema_mismatch, "zstandard codec not compiled in", "avro.codec"});
#endif
    }
  }
  return std::unexpected(error{error_code::internal, "unknown codec", "avro.codec"});
}

auto compress(Codec c, std::span<const std::uint8_t> in) -> std::expected<std::vector<std::uint8_t>, error> {
  switch (c) {
    case Codec::null:
      return std::vector<std::uint8_t>(in.begin(), in.end());
    case Codec::deflate:
      return deflate_raw(in);
    case Codec::zstandard: {
#ifdef BLOBFEED_HAS_ZSTD
      std::vector<std::uint8_t> out(ZSTD_compressBound(in.size()));
      const std::size_t got = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), 3);
      if (ZSTD_isError(got)) {
        return std::unexpected(error{error_code::internal, "zstd compression failed", "avro.codec"});
      }
      out.resize(got);
      return out;
#else
      return std::unexpected(error{error_code::schema_mismatch, "zstandard codec not compiled in", "avro.codec"});
#endif
    }
  }
  return std::unexpected(error{error_code::internal, "unknown codec", "avro.codec"});
}

} // namespace blobfeed::avro
