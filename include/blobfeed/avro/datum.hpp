#pragma once

/** \file datum.hpp
 *  \brief Generic Avro value, decoded/encoded against a schema Node.
 *
 * Records and maps keep insertion (schema / wire) order so a decode followed by
 * an encode reproduces the original bytes. A value decoded from a union
 * remembers the branch it came from.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "blobfeed/avro/binary.hpp"
#include "blobfeed/avro/schema.hpp"
#include "blobfeed/error.hpp"

namespace blobfeed::avro {

class Datum;

struct Bytes {
  std::vector<std::uint8_t> data;
  bool operator==(const Bytes&) const = default;
};

struct Fixed {
  std::vector<std::uint8_t> data;
  bool operator==(const Fixed&) const = default;
};

struct EnumValue {
  std::int32_t index{0};
  std::string symbol;
  bool operator==(const EnumValue&) const = default;
};

struct Array {
  std::vector<Datum> items;
  bool operator==(const Array&) const;
};

/** Record and map share the same ordered name/value layout. */
struct Record {
  std::vector<std::string> names;
  std::vector<Datum> values;
  bool operator==(const Record&) const;

  auto find(std::string_view name) const noexcept -> const Datum*;
  void set(std::string name, Datum value);
};

struct Map {
  std::vector<std::string> keys;
  std::vector<Datum> values;
  bool operator==(const Map&) const;
};

class Datum {
public:
  using Value = std::variant<std::monostate, bool, std::int32_t, std::int64_t, float, double,
                             Bytes, std::string, Record, EnumValue, Array, Map, Fixed>;

  Datum() = default;
  Datum(Value v, std::int32_t branch = -1) : value_(std::move(v)), branch_(branch) {}

  const Value& value() const noexcept { return value_; }
  Value& value() noexcept { return value_; }
  /** Union branch index the value was decoded from, -1 when not from a union. */
  std::int32_t branch() const noexcept { return branch_; }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(value_); }
  template <class T> const T* get_if() const noexcept { return std::get_if<T>(&value_); }

  /** Record field lookup; nullptr if not a record or absent. */
  auto field(std::string_view name) const noexcept -> const Datum*;
  /** Text of a string or enum value. */
  auto text() const noexcept -> std::optional<std::string_view>;
  /** Numeric value of an int or long. */
  auto integer() const noexcept -> std::optional<std::int64_t>;

  bool operator==(const Datum& o) const { return value_ == o.value_; }

private:
  Value value_{};
  std::int32_t branch_{-1};
};

/** \brief Decodes one value of \p node from \p in. */
[[nodiscard]] auto decode_datum(BinaryReader& in, const Node& node)
    -> std::expected<Datum, core::error>;

/** \brief Encodes \p value as \p node; mismatched shapes yield invalid_argument. */
[[nodiscard]] auto encode_datum(std::vector<std::uint8_t>& out, const Node& node, const Datum& value)
    -> std::expected<void, core::error>;

} // namespace blobfeed::avro
