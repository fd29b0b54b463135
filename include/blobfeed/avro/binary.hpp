#pragma once

/** \file binary.hpp
 *  \brief Avro binary encoding primitives (zig-zag varints, length-prefixed bytes, IEEE floats).
 *
 * Endianness: floats/doubles little-endian as the Avro binary encoding requires.
 * Reads past the end of the buffer fail with error_code::io_eof so callers can
 * tell "need more bytes" apart from malformed input.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/error.hpp"

namespace blobfeed::avro {

class BinaryReader {
public:
  explicit BinaryReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

  auto read_long() -> std::expected<std::int64_t, core::error>;
  auto read_int() -> std::expected<std::int32_t, core::error>;
  auto read_bool() -> std::expected<bool, core::error>;
  auto read_float() -> std::expected<float, core::error>;
  auto read_double() -> std::expected<double, core::error>;
  /** Length-prefixed bytes; the span aliases the reader's buffer. */
  auto read_bytes() -> std::expected<std::span<const std::uint8_t>, core::error>;
  auto read_string() -> std::expected<std::string, core::error>;
  auto read_fixed(std::size_t n) -> std::expected<std::span<const std::uint8_t>, core::error>;

  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return bytes_.size() - pos_; }
  bool at_end() const noexcept { return pos_ == bytes_.size(); }

private:
  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
};

void write_long(std::vector<std::uint8_t>& out, std::int64_t v);
void write_int(std::vector<std::uint8_t>& out, std::int32_t v);
void write_bool(std::vector<std::uint8_t>& out, bool v);
void write_float(std::vector<std::uint8_t>& out, float v);
void write_double(std::vector<std::uint8_t>& out, double v);
void write_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> v);
void write_string(std::vector<std::uint8_t>& out, std::string_view v);

} // namespace blobfeed::avro
