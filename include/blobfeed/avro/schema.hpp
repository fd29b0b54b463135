#pragma once

/** \file schema.hpp
 *  \brief Avro schema model parsed from the container header's avro.schema JSON.
 *
 * Supported: all primitives, record, enum, array, map, union, fixed and named
 * references (including recursive records). Logical types are recorded but
 * values are carried as their underlying type.
 * Nodes are owned by the Schema; copies of a Schema share the same node graph.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/error.hpp"

namespace blobfeed::avro {

enum class Type : std::uint8_t {
  null, boolean, int_, long_, float_, double_, bytes, string,
  record, enum_, array, map, union_, fixed,
};

auto to_string(Type t) noexcept -> std::string_view;

struct Node;

struct Field {
  std::string name;
  const Node* type{nullptr};
};

struct Node {
  Type type{Type::null};
  std::string fullname;                 // named types only
  std::string logical_type;             // informational
  std::vector<Field> fields;            // record
  std::vector<std::string> symbols;     // enum
  const Node* items{nullptr};           // array items / map values
  std::vector<const Node*> branches;    // union
  std::size_t fixed_size{0};            // fixed

  /** Index of a record field by name, or -1. */
  auto field_index(std::string_view name) const noexcept -> int;
  /** Index of an enum symbol, or -1. */
  auto symbol_index(std::string_view symbol) const noexcept -> int;
};

class Schema {
public:
  Schema() = default;

  /** \brief Parses schema JSON; unsupported or malformed schemas yield schema_mismatch. */
  static auto parse(std::string_view json) -> std::expected<Schema, core::error>;

  const Node& root() const noexcept { return *root_; }
  bool valid() const noexcept { return root_ != nullptr; }
  /** Original JSON text as found in the container header. */
  const std::string& json() const noexcept { return graph_->json; }

private:
  struct Graph {
    std::string json;
    std::vector<std::unique_ptr<Node>> nodes;
  };
  std::shared_ptr<const Graph> graph_;
  const Node* root_{nullptr};
};

} // namespace blobfeed::avro
