#include "blobfeed/avro/binary.hpp"

#include <cstring>
#include <limits>

namespace blobfeed::avro {

namespace {

auto eof() -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::io_eof, "unexpected end of data", "avro.binary"});
}

auto malformed(const char* what) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::data_integrity, what, "avro.binary"});
}

} // namespace

auto BinaryReader::read_long() -> std::expected<std::int64_t, core::error> {
  std::uint64_t acc = 0;
  for (int shift = 0; shift < 70; shift += 7) {
    if (pos_ >= bytes_.size()) return eof();
    const std::uint8_t b = bytes_[pos_++];
    if (shift == 63 && (b & 0x7Eu) != 0) return malformed("varint overflow");
    acc |= static_cast<std::uint64_t>(b & 0x7Fu) << shift;
    if ((b & 0x80u) == 0) {
      return static_cast<std::int64_t>((acc >> 1) ^ (~(acc & 1u) + 1u));
    }
  }
  return malformed("varint too long");
}

auto BinaryReader::read_int() -> std::expected<std::int32_t, core::error> {
  auto v = read_long();
  if (!v) return std::unexpected(v.error());
  if (*v < std::numeric_limits<std::int32_t>::min() || *v > std::numeric_limits<std::int32_t>::max()) {
    return malformed("int out of range");
  }
  return static_cast<std::int32_t>(*v);
}

auto BinaryReader::read_bool() -> std::expected<bool, core::error> {
  if (pos_ >= bytes_.size()) return eof();
  const std::uint8_t b = bytes_[pos_++];
  if (b > 1) return malformed("invalid boolean");
  return b == 1;
}

auto BinaryReader::read_float() -> std::expected<float, core::error> {
  if (remaining() < 4) return eof();
  std::uint32_t bits = 0;
  for (int i = 0; i < 4; ++i) bits |= static_cast<std::uint32_t>(bytes_[pos_ + i]) << (8 * i);
  pos_ += 4;
  float f;
  std::memcpy(&f, &bits, 4);
  return f;
}

auto BinaryReader::read_double() -> std::expected<double, core::error> {
  if (remaining() < 8) return eof();
  std::uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) bits |= static_cast<std::uint64_t>(bytes_[pos_ + i]) << (8 * i);
  pos_ += 8;
  double d;
  std::memcpy(&d, &bits, 8);
  return d;
}

auto BinaryReader::read_bytes() -> std::expected<std::span<const std::uint8_t>, core::error> {
  auto n = read_long();
  if (!n) return std::unexpected(n.error());
  if (*n < 0) return malformed("negative length");
  return read_fixed(static_cast<std::size_t>(*n));
}

auto BinaryReader::read_string() -> std::expected<std::string, core::error> {
  auto b = read_bytes();
  if (!b) return std::unexpected(b.error());
  return std::string(reinterpret_cast<const char*>(b->data()), b->size());
}

auto BinaryReader::read_fixed(std::size_t n) -> std::expected<std::span<const std::uint8_t>, core::error> {
  if (remaining() < n) return eof();
  auto s = bytes_.subspan(pos_, n);
  pos_ += n;
  return s;
}

void write_long(std::vector<std::uint8_t>& out, std::int64_t v) {
  std::uint64_t z = (static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63);
  while (z >= 0x80u) {
    out.push_back(static_cast<std::uint8_t>((z & 0x7Fu) | 0x80u));
    z >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(z));
}

void write_int(std::vector<std::uint8_t>& out, std::int32_t v) { write_long(out, v); }

void write_bool(std::vector<std::uint8_t>& out, bool v) { out.push_back(v ? 1 : 0); }

void write_float(std::vector<std::uint8_t>& out, float v) {
  std::uint32_t bits;
  std::memcpy(&bits, &v, 4);
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>(bits >> (8 * i)));
}

void write_double(std::vector<std::uint8_t>& out, double v) {
  std::uint64_t bits;
  std::memcpy(&bits, &v, 8);
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<std::uint8_t>(bits >> (8 * i)));
}

void write_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> v) {
  write_long(out, static_cast<std::int64_t>(v.size()));
  out.insert(out.end(), v.begin(), v.end());
}

void write_string(std::vector<std::uint8_t>& out, std::string_view v) {
  write_long(out, static_cast<std::int64_t>(v.size()));
  out.insert(out.end(), v.begin(), v.end());
}

} // namespace blobfeed::avro
