#include "blobfeed/avro/datum.hpp"

#include <limits>

namespace blobfeed::avro {

using core::error;
using core::error_code;

bool Array::operator==(const Array& o) const { return items == o.items; }
bool Record::operator==(const Record& o) const { return names == o.names && values == o.values; }
bool Map::operator==(const Map& o) const { return keys == o.keys && values == o.values; }

auto Record::find(std::string_view name) const noexcept -> const Datum* {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) return &values[i];
  }
  return nullptr;
}

void Record::set(std::string name, Datum value) {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) { values[i] = std::move(value); return; }
  }
  names.push_back(std::move(name));
  values.push_back(std::move(value));
}

auto Datum::field(std::string_view name) const noexcept -> const Datum* {
  const auto* r = get_if<Record>();
  return r ? r->find(name) : nullptr;
}

auto Datum::text() const noexcept -> std::optional<std::string_view> {
  if (const auto* s = get_if<std::string>()) return std::string_view(*s);
  if (const auto* e = get_if<EnumValue>()) return std::string_view(e->symbol);
  return std::nullopt;
}

auto Datum::integer() const noexcept -> std::optional<std::int64_t> {
  if (const auto* l = get_if<std::int64_t>()) return *l;
  if (const auto* i = get_if<std::int32_t>()) return *i;
  return std::nullopt;
}

namespace {

constexpr int kMaxDepth = 64;

auto corrupt(std::string msg) -> std::unexpected<error> {
  return std::unexpected(error{error_code::data_integrity, std::move(msg), "avro.datum"});
}

auto shape(const Node& node, std::string_view detail) -> std::unexpected<error> {
  return std::unexpected(error{error_code::invalid_argument,
                               std::string("value does not match schema type ") +
                                   std::string(to_string(node.type)) + ": " + std::string(detail),
                               "avro.datum"});
}

// Reads the blocked count framing shared by arrays and maps. Negative counts carry a byte size.
auto read_block_count(BinaryReader& in) -> std::expected<std::int64_t, error> {
  auto n = in.read_long();
  if (!n) return n;
  if (*n < 0) {
    if (*n == std::numeric_limits<std::int64_t>::min()) return corrupt("invalid block count");
    auto bytes = in.read_long();
    if (!bytes) return std::unexpected(bytes.error());
    return -*n;
  }
  return *n;
}

auto decode(BinaryReader& in, const Node& node, int depth) -> std::expected<Datum, error> {
  if (depth > kMaxDepth) return corrupt("value nesting too deep");
  switch (node.type) {
    case Type::null:
      return Datum{};
    case Type::boolean: {
      auto v = in.read_bool(); if (!v) return std::unexpected(v.error());
      return Datum{*v};
    }
    case Type::int_: {
      auto v = in.read_int(); if (!v) return std::unexpected(v.error());
      return Datum{*v};
    }
    case Type::long_: {
      auto v = in.read_long(); if (!v) return std::unexpected(v.error());
      return Datum{*v};
    }
    case Type::float_: {
      auto v = in.read_float(); if (!v) return std::unexpected(v.error());
      return Datum{*v};
    }
    case Type::double_: {
      auto v = in.read_double(); if (!v) return std::unexpected(v.error());
      return Datum{*v};
    }
    case Type::bytes: {
      auto v = in.read_bytes(); if (!v) return std::unexpected(v.error());
      return Datum{Bytes{{v->begin(), v->end()}}};
    }
    case Type::string: {
      auto v = in.read_string(); if (!v) return std::unexpected(v.error());
      return Datum{std::move(*v)};
    }
    case Type::fixed: {
      auto v = in.read_fixed(node.fixed_size); if (!v) return std::unexpected(v.error());
      return Datum{Fixed{{v->begin(), v->end()}}};
    }
    case Type::enum_: {
      auto v = in.read_int(); if (!v) return std::unexpected(v.error());
      if (*v < 0 || static_cast<std::size_t>(*v) >= node.symbols.size()) {
        return corrupt("enum index " + std::to_string(*v) + " out of range for " + node.fullname);
      }
      return Datum{EnumValue{*v, node.symbols[static_cast<std::size_t>(*v)]}};
    }
    case Type::union_: {
      auto v = in.read_long(); if (!v) return std::unexpected(v.error());
      if (*v < 0 || static_cast<std::size_t>(*v) >= node.branches.size()) {
        return corrupt("union branch " + std::to_string(*v) + " out of range");
      }
      auto inner = decode(in, *node.branches[static_cast<std::size_t>(*v)], depth + 1);
      if (!inner) return inner;
      return Datum{std::move(inner->value()), static_cast<std::int32_t>(*v)};
    }
    case Type::record: {
      Record r;
      r.names.reserve(node.fields.size());
      r.values.reserve(node.fields.size());
      for (const auto& f : node.fields) {
        auto v = decode(in, *f.type, depth + 1);
        if (!v) return v;
        r.names.push_back(f.name);
        r.values.push_back(std::move(*v));
      }
      return Datum{std::move(r)};
    }
    case Type::array: {
      Array a;
      while (true) {
        auto n = read_block_count(in); if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        // Every item consumes at least one byte unless the item type is null; bound against the buffer.
        if (node.items->type != Type::null && static_cast<std::uint64_t>(*n) > in.remaining()) {
          return std::unexpected(error{error_code::io_eof, "array count exceeds data", "avro.datum"});
        }
        for (std::int64_t i = 0; i < *n; ++i) {
          auto v = decode(in, *node.items, depth + 1);
          if (!v) return v;
          a.items.push_back(std::move(*v));
        }
      }
      return Datum{std::move(a)};
    }
    case Type::map: {
      Map m;
      while (true) {
        auto n = read_block_count(in); if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        if (static_cast<std::uint64_t>(*n) > in.remaining()) {
          return std::unexpected(error{error_code::io_eof, "map count exceeds data", "avro.datum"});
        }
        for (std::int64_t i = 0; i < *n; ++i) {
          auto k = in.read_string(); if (!k) return std::unexpected(k.error());
          auto v = decode(in, *node.items, depth + 1);
          if (!v) return v;
          m.keys.push_back(std::move(*k));
          m.values.push_back(std::move(*v));
        }
      }
      return Datum{std::move(m)};
    }
  }
  return corrupt("unsupported schema type");
}

// Union branch for a value that was not decoded from a union (or whose branch is stale).
auto pick_branch(const Node& node, const Datum& v) -> int {
  if (v.branch() >= 0 && static_cast<std::size_t>(v.branch()) < node.branches.size()) return v.branch();
  for (std::size_t i = 0; i < node.branches.size(); ++i) {
    const Type t = node.branches[i]->type;
    const bool match = std::visit([t](const auto& x) {
      using X = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<X, std::monostate>) return t == Type::null;
      else if constexpr (std::is_same_v<X, bool>) return t == Type::boolean;
      else if constexpr (std::is_same_v<X, std::int32_t>) return t == Type::int_ || t == Type::long_;
      else if constexpr (std::is_same_v<X, std::int64_t>) return t == Type::long_;
      else if constexpr (std::is_same_v<X, float>) return t == Type::float_ || t == Type::double_;
      else if constexpr (std::is_same_v<X, double>) return t == Type::double_;
      else if constexpr (std::is_same_v<X, Bytes>) return t == Type::bytes;
      else if constexpr (std::is_same_v<X, std::string>) return t == Type::string || t == Type::enum_;
      else if constexpr (std::is_same_v<X, Record>) return t == Type::record;
      else if constexpr (std::is_same_v<X, EnumValue>) return t == Type::enum_;
      else if constexpr (std::is_same_v<X, Array>) return t == Type::array;
      else if constexpr (std::is_same_v<X, Map>) return t == Type::map;
      else return t == Type::fixed;
    }, v.value());
    if (match) return static_cast<int>(i);
  }
  return -1;
}

auto encode(std::vector<std::uint8_t>& out, const Node& node, const Datum& v, int depth)
    -> std::expected<void, error> {
  if (depth > kMaxDepth) return shape(node, "nesting too deep");
  switch (node.type) {
    case Type::null:
      if (!v.is_null()) return shape(node, "expected null");
      return {};
    case Type::boolean:
      if (const auto* b = v.get_if<bool>()) { write_bool(out, *b); return {}; }
      return shape(node, "expected boolean");
    case Type::int_:
      if (const auto* i = v.get_if<std::int32_t>()) { write_int(out, *i); return {}; }
      return shape(node, "expected int");
    case Type::long_:
      if (auto i = v.integer()) { write_long(out, *i); return {}; }
      return shape(node, "expected long");
    case Type::float_:
      if (const auto* f = v.get_if<float>()) { write_float(out, *f); return {}; }
      return shape(node, "expected float");
    case Type::double_:
      if (const auto* d = v.get_if<double>()) { write_double(out, *d); return {}; }
      if (const auto* f = v.get_if<float>()) { write_double(out, *f); return {}; }
      return shape(node, "expected double");
    case Type::bytes:
      if (const auto* b = v.get_if<Bytes>()) { write_bytes(out, b->data); return {}; }
      return shape(node, "expected bytes");
    case Type::string:
      if (const auto* s = v.get_if<std::string>()) { write_string(out, *s); return {}; }
      return shape(node, "expected string");
    case Type::fixed:
      if (const auto* f = v.get_if<Fixed>(); f && f->data.size() == node.fixed_size) {
        out.insert(out.end(), f->data.begin(), f->data.end());
        return {};
      }
      return shape(node, "expected fixed of size " + std::to_string(node.fixed_size));
    case Type::enum_: {
      auto sym = v.text();
      if (!sym) return shape(node, "expected enum symbol");
      const int idx = node.symbol_index(*sym);
      if (idx < 0) return shape(node, "symbol \"" + std::string(*sym) + "\" not in " + node.fullname);
      write_int(out, idx);
      return {};
    }
    case Type::union_: {
      const int br = pick_branch(node, v);
      if (br < 0) return shape(node, "no union branch accepts the value");
      write_long(out, br);
      return encode(out, *node.branches[static_cast<std::size_t>(br)], Datum{v.value()}, depth + 1);
    }
    case Type::record: {
      const auto* r = v.get_if<Record>();
      if (!r) return shape(node, "expected record " + node.fullname);
      for (const auto& f : node.fields) {
        const Datum* fv = r->find(f.name);
        static const Datum kNull{};
        if (auto rr = encode(out, *f.type, fv ? *fv : kNull, depth + 1); !rr) return rr;
      }
      return {};
    }
    case Type::array: {
      const auto* a = v.get_if<Array>();
      if (!a) return shape(node, "expected array");
      if (!a->items.empty()) {
        write_long(out, static_cast<std::int64_t>(a->items.size()));
        for (const auto& item : a->items) {
          if (auto rr = encode(out, *node.items, item, depth + 1); !rr) return rr;
        }
      }
      write_long(out, 0);
      return {};
    }
    case Type::map: {
      const auto* m = v.get_if<Map>();
      if (!m) return shape(node, "expected map");
      if (!m->keys.empty()) {
        write_long(out, static_cast<std::int64_t>(m->keys.size()));
        for (std::size_t i = 0; i < m->keys.size(); ++i) {
          write_string(out, m->keys[i]);
          if (auto rr = encode(out, *node.items, m->values[i], depth + 1); !rr) return rr;
        }
      }
      write_long(out, 0);
      return {};
    }
  }
  return shape(node, "unsupported schema type");
}

} // namespace

auto decode_datum(BinaryReader& in, const Node& node) -> std::expected<Datum, error> {
  return decode(in, node, 0);
}

auto encode_datum(std::vector<std::uint8_t>& out, const Node& node, const Datum& value)
    -> std::expected<void, error> {
  return encode(out, node, value, 0);
}

} // namespace blobfeed::avro
