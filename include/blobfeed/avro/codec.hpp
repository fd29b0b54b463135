#pragma once

/** \file codec.hpp
 *  \brief Block compression codecs named by the container header's avro.codec entry.
 *
 * - null: identity
 * - deflate: raw RFC 1951 stream (no zlib/gzip wrapper), via zlib
 * - zstandard: one zstd frame per block, via libzstd (requires BLOBFEED_HAS_ZSTD)
 * Unrecognized codec names are a schema_mismatch.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "blobfeed/error.hpp"

namespace blobfeed::avro {

enum class Codec : std::uint8_t { null, deflate, zstandard };

[[nodiscard]] auto parse_codec(std::string_view name) -> std::expected<Codec, core::error>;
auto codec_name(Codec c) noexcept -> std::string_view;

/** \brief Decompresses one block payload; bounded by \p max_output bytes. */
[[nodiscard]] auto decompress(Codec c, std::span<const std::uint8_t> in, std::size_t max_output)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

[[nodiscard]] auto compress(Codec c, std::span<const std::uint8_t> in)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace blobfeed::avro
