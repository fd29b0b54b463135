#include "blobfeed/avro/schema.hpp"

#include <unordered_map>

#include <nlohmann/json.hpp>

namespace blobfeed::avro {

using core::error;
using core::error_code;
using nlohmann::json;

auto to_string(Type t) noexcept -> std::string_view {
  switch (t) {
    case Type::null: return "null";
    case Type::boolean: return "boolean";
    case Type::int_: return "int";
    case Type::long_: return "long";
    case Type::float_: return "float";
    case Type::double_: return "double";
    case Type::bytes: return "bytes";
    case Type::string: return "string";
    case Type::record: return "record";
    case Type::enum_: return "enum";
    case Type::array: return "array";
    case Type::map: return "map";
    case Type::union_: return "union";
    case Type::fixed: return "fixed";
  }
  return "unknown";
}

auto Node::field_index(std::string_view name) const noexcept -> int {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].name == name) return static_cast<int>(i);
  }
  return -1;
}

auto Node::symbol_index(std::string_view symbol) const noexcept -> int {
  for (std::size_t i = 0; i < symbols.size(); ++i) {
    if (symbols[i] == symbol) return static_cast<int>(i);
  }
  return -1;
}

namespace {

auto mismatch(std::string msg) -> std::unexpected<error> {
  return std::unexpected(error{error_code::schema_mismatch, std::move(msg), "avro.schema"});
}

bool primitive_type(std::string_view name, Type& out) {
  static const std::unordered_map<std::string_view, Type> kPrim = {
    {"null", Type::null}, {"boolean", Type::boolean}, {"int", Type::int_}, {"long", Type::long_},
    {"float", Type::float_}, {"double", Type::double_}, {"bytes", Type::bytes}, {"string", Type::string},
  };
  auto it = kPrim.find(name);
  if (it == kPrim.end()) return false;
  out = it->second;
  return true;
}

class Builder {
public:
  explicit Builder(std::vector<std::unique_ptr<Node>>& nodes) : nodes_(nodes) {}

  auto build(const json& j, const std::string& ns, int depth) -> std::expected<const Node*, error> {
    if (depth > 64) return mismatch("schema nesting too deep");
    if (j.is_string()) return from_name(j.get<std::string>(), ns);
    if (j.is_array()) return build_union(j, ns, depth);
    if (!j.is_object()) return mismatch("schema must be a string, array or object");

    auto tit = j.find("type");
    if (tit == j.end()) return mismatch("schema object without \"type\"");
    if (!tit->is_string()) return build(*tit, ns, depth + 1);

    const auto type_name = tit->get<std::string>();
    Type prim{};
    if (primitive_type(type_name, prim)) {
      Node* n = make(prim);
      if (auto lt = j.find("logicalType"); lt != j.end() && lt->is_string()) n->logical_type = lt->get<std::string>();
      return n;
    }
    if (type_name == "record" || type_name == "error") return build_record(j, ns, depth);
    if (type_name == "enum") return build_enum(j, ns);
    if (type_name == "fixed") return build_fixed(j, ns);
    if (type_name == "array") {
      auto it = j.find("items");
      if (it == j.end()) return mismatch("array without \"items\"");
      auto items = build(*it, ns, depth + 1);
      if (!items) return items;
      Node* n = make(Type::array);
      n->items = *items;
      return n;
    }
    if (type_name == "map") {
      auto it = j.find("values");
      if (it == j.end()) return mismatch("map without \"values\"");
      auto values = build(*it, ns, depth + 1);
      if (!values) return values;
      Node* n = make(Type::map);
      n->items = *values;
      return n;
    }
    return from_name(type_name, ns);
  }

private:
  Node* make(Type t) {
    nodes_.push_back(std::make_unique<Node>());
    nodes_.back()->type = t;
    return nodes_.back().get();
  }

  static auto full_name(const json& j, const std::string& ns, std::string& out_ns)
      -> std::expected<std::string, error> {
    auto nit = j.find("name");
    if (nit == j.end() || !nit->is_string() || nit->get<std::string>().empty()) {
      return mismatch("named type without \"name\"");
    }
    auto name = nit->get<std::string>();
    if (name.find('.') != std::string::npos) {
      out_ns = name.substr(0, name.rfind('.'));
      return name;
    }
    out_ns = ns;
    if (auto sit = j.find("namespace"); sit != j.end() && sit->is_string()) out_ns = sit->get<std::string>();
    return out_ns.empty() ? name : out_ns + "." + name;
  }

  auto register_named(const std::string& fullname, Node* n) -> std::expected<void, error> {
    if (!named_.emplace(fullname, n).second) return mismatch("duplicate named type " + fullname);
    return {};
  }

  auto from_name(const std::string& name, const std::string& ns) -> std::expected<const Node*, error> {
    Type prim{};
    if (primitive_type(name, prim)) return make(prim);
    if (name.find('.') == std::string::npos && !ns.empty()) {
      if (auto it = named_.find(ns + "." + name); it != named_.end()) return it->second;
    }
    if (auto it = named_.find(name); it != named_.end()) return it->second;
    return mismatch("unknown type \"" + name + "\"");
  }

  auto build_union(const json& j, const std::string& ns, int depth) -> std::expected<const Node*, error> {
    if (j.empty()) return mismatch("empty union");
    Node* n = make(Type::union_);
    for (const auto& b : j) {
      auto br = build(b, ns, depth + 1);
      if (!br) return br;
      if ((*br)->type == Type::union_) return mismatch("nested union");
      n->branches.push_back(*br);
    }
    return n;
  }

  auto build_record(const json& j, const std::string& ns, int depth) -> std::expected<const Node*, error> {
    std::string inner_ns;
    auto fn = full_name(j, ns, inner_ns);
    if (!fn) return std::unexpected(fn.error());
    Node* n = make(Type::record);
    n->fullname = *fn;
    if (auto r = register_named(*fn, n); !r) return std::unexpected(r.error());
    auto fit = j.find("fields");
    if (fit == j.end() || !fit->is_array()) return mismatch("record " + *fn + " without \"fields\"");
    for (const auto& f : *fit) {
      if (!f.is_object()) return mismatch("record field must be an object");
      auto name_it = f.find("name");
      auto type_it = f.find("type");
      if (name_it == f.end() || !name_it->is_string() || type_it == f.end()) {
        return mismatch("record " + *fn + " has a field without name/type");
      }
      auto ft = build(*type_it, inner_ns, depth + 1);
      if (!ft) return ft;
      n->fields.push_back(Field{name_it->get<std::string>(), *ft});
    }
    return n;
  }

  auto build_enum(const json& j, const std::string& ns) -> std::expected<const Node*, error> {
    std::string inner_ns;
    auto fn = full_name(j, ns, inner_ns);
    if (!fn) return std::unexpected(fn.error());
    Node* n = make(Type::enum_);
    n->fullname = *fn;
    if (auto r = register_named(*fn, n); !r) return std::unexpected(r.error());
    auto sit = j.find("symbols");
    if (sit == j.end() || !sit->is_array()) return mismatch("enum " + *fn + " without \"symbols\"");
    for (const auto& s : *sit) {
      if (!s.is_string()) return mismatch("enum " + *fn + " has a non-string symbol");
      n->symbols.push_back(s.get<std::string>());
    }
    return n;
  }

  auto build_fixed(const json& j, const std::string& ns) -> std::expected<const Node*, error> {
    std::string inner_ns;
    auto fn = full_name(j, ns, inner_ns);
    if (!fn) return std::unexpected(fn.error());
    auto sit = j.find("size");
    if (sit == j.end() || !sit->is_number_unsigned()) return mismatch("fixed " + *fn + " without \"size\"");
    Node* n = make(Type::fixed);
    n->fullname = *fn;
    n->fixed_size = sit->get<std::size_t>();
    if (auto r = register_named(*fn, n); !r) return std::unexpected(r.error());
    return n;
  }

  std::vector<std::unique_ptr<Node>>& nodes_;
  std::unordered_map<std::string, Node*> named_;
};

} // namespace

auto Schema::parse(std::string_view text) -> std::expected<Schema, error> {
  const nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return mismatch("schema is not valid JSON");

  auto g = std::make_shared<Graph>();
  g->json = std::string(text);
  Builder b(g->nodes);
  auto root = b.build(j, "", 0);
  if (!root) return std::unexpected(root.error());

  Schema s;
  s.root_ = *root;
  s.graph_ = std::move(g);
  return s;
}

} // namespace blobfeed::avro
