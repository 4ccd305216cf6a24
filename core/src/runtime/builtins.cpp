#include "runtime.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "../conversion.h"
#include "../util/string_util.h"

namespace xpathq::runtime {

namespace {

const XmlNode& node_of(const Invocation& inv, const Value& value, const char* operation) {
  return node_at(inv.doc, expect_node(value, operation));
}

bool is_tree_node(const XmlNode& node) {
  return node.kind != NodeKind::Attribute && node.kind != NodeKind::Namespace;
}

void collect_descendants(const XmlDocument& doc, int64_t id, NodeList& out) {
  for (int64_t child : doc.nodes[static_cast<size_t>(id)].children) {
    out.push_back(child);
    collect_descendants(doc, child, out);
  }
}

bool is_ancestor_of(const XmlDocument& doc, int64_t ancestor, int64_t id) {
  std::optional<int64_t> cur = doc.nodes[static_cast<size_t>(id)].parent_id;
  while (cur.has_value()) {
    if (*cur == ancestor) return true;
    cur = doc.nodes[static_cast<size_t>(*cur)].parent_id;
  }
  return false;
}

/// Returns the tree siblings of a node and its index among them.
/// MUST return an empty list for attributes and the document node.
/// Inputs are doc/node; outputs are the parent's children and the index.
const NodeList* siblings_of(const XmlDocument& doc, const XmlNode& node, size_t& index) {
  static const NodeList kEmpty;
  if (!is_tree_node(node) || !node.parent_id.has_value()) return &kEmpty;
  const NodeList& kids = doc.nodes[static_cast<size_t>(*node.parent_id)].children;
  auto it = std::find(kids.begin(), kids.end(), node.id);
  index = static_cast<size_t>(it - kids.begin());
  return &kids;
}

Value children(const Invocation& inv, Args& args) {
  return node_of(inv, args.at(0), "children").children;
}

Value attributes(const Invocation& inv, Args& args) {
  return node_of(inv, args.at(0), "attributes").attributes;
}

Value parent(const Invocation& inv, Args& args) {
  const XmlNode& node = node_of(inv, args.at(0), "parent");
  if (!node.parent_id.has_value()) return std::monostate{};
  return NodeRef{*node.parent_id};
}

Value descendants(const Invocation& inv, Args& args) {
  NodeList out;
  collect_descendants(inv.doc, expect_node(args.at(0), "descendants"), out);
  return out;
}

Value descendants_or_self(const Invocation& inv, Args& args) {
  int64_t id = expect_node(args.at(0), "descendants_or_self");
  NodeList out{id};
  collect_descendants(inv.doc, id, out);
  return out;
}

// Nearest ancestor first.
Value ancestors(const Invocation& inv, Args& args) {
  NodeList out;
  std::optional<int64_t> cur = node_of(inv, args.at(0), "ancestors").parent_id;
  while (cur.has_value()) {
    out.push_back(*cur);
    cur = inv.doc.nodes[static_cast<size_t>(*cur)].parent_id;
  }
  return out;
}

Value ancestors_or_self(const Invocation& inv, Args& args) {
  int64_t id = expect_node(args.at(0), "ancestors_or_self");
  NodeList out{id};
  Value rest = ancestors(inv, args);
  const NodeList& tail = std::get<NodeList>(rest);
  out.insert(out.end(), tail.begin(), tail.end());
  return out;
}

Value following_siblings(const Invocation& inv, Args& args) {
  size_t index = 0;
  const NodeList* kids = siblings_of(inv.doc, node_of(inv, args.at(0), "following_siblings"), index);
  NodeList out;
  for (size_t i = index + 1; i < kids->size(); ++i) out.push_back((*kids)[i]);
  return out;
}

// Nearest sibling first.
Value preceding_siblings(const Invocation& inv, Args& args) {
  size_t index = 0;
  const NodeList* kids = siblings_of(inv.doc, node_of(inv, args.at(0), "preceding_siblings"), index);
  NodeList out;
  for (size_t i = std::min(index, kids->size()); i > 0; --i) out.push_back((*kids)[i - 1]);
  return out;
}

/// Lists nodes after the context in document order, excluding descendants.
/// MUST skip attributes and the document node.
/// Inputs are the context node; outputs are node lists in document order.
Value following(const Invocation& inv, Args& args) {
  const XmlNode& ctx = node_of(inv, args.at(0), "following");
  NodeList out;
  for (const auto& node : inv.doc.nodes) {
    if (!is_tree_node(node) || node.kind == NodeKind::Document) continue;
    if (node.doc_order <= ctx.doc_order) continue;
    if (is_ancestor_of(inv.doc, ctx.id, node.id)) continue;
    out.push_back(node.id);
  }
  sort_document_order(inv.doc, out);
  return out;
}

// Nearest node first, ancestors excluded.
Value preceding(const Invocation& inv, Args& args) {
  const XmlNode& ctx = node_of(inv, args.at(0), "preceding");
  NodeList out;
  for (const auto& node : inv.doc.nodes) {
    if (!is_tree_node(node) || node.kind == NodeKind::Document) continue;
    if (node.doc_order >= ctx.doc_order) continue;
    if (is_ancestor_of(inv.doc, node.id, ctx.id)) continue;
    out.push_back(node.id);
  }
  sort_document_order(inv.doc, out);
  std::reverse(out.begin(), out.end());
  return out;
}

Value root(const Invocation& inv, Args& args) {
  int64_t id = expect_node(args.at(0), "root");
  std::optional<int64_t> cur = inv.doc.nodes[static_cast<size_t>(id)].parent_id;
  while (cur.has_value()) {
    id = *cur;
    cur = inv.doc.nodes[static_cast<size_t>(id)].parent_id;
  }
  return NodeRef{id};
}

Value is_a(const Invocation& inv, Args& args) {
  const XmlNode& node = node_of(inv, args.at(0), "is_a");
  const std::string* kind = std::get_if<std::string>(&args.at(1));
  return kind != nullptr && *kind == node_kind_name(node.kind);
}

Value local_name(const Invocation& inv, Args& args) {
  return node_of(inv, args.at(0), "local_name").local_name;
}

Value namespace_uri(const Invocation& inv, Args& args) {
  return node_of(inv, args.at(0), "namespace_uri").namespace_uri;
}

Value namespace_prefix(const Invocation& inv, Args& args) {
  return node_of(inv, args.at(0), "namespace_prefix").prefix;
}

Value present(const Invocation&, Args& args) {
  return !std::holds_alternative<std::monostate>(args.at(0));
}

// ASCII case-insensitive name comparison for node tests.
Value name_equals_ci(const Invocation& inv, Args& args) {
  return util::to_lower(conversion::to_string(args.at(0), inv.doc)) ==
         util::to_lower(conversion::to_string(args.at(1), inv.doc));
}

Value count(const Invocation&, Args& args) {
  return static_cast<double>(expect_node_set(args.at(0), "count").size());
}

Value sort_unique(const Invocation& inv, Args& args) {
  NodeList nodes = expect_node_set(args.at(0), "sort_unique");
  sort_document_order(inv.doc, nodes);
  return nodes;
}

Value node_set(const Invocation&, Args& args) {
  return expect_node_set(args.at(0), "node_set");
}

/// Applies a predicate result at a proximity position.
/// MUST treat numbers as position tests and everything else as booleans.
/// Inputs are the predicate value and position; outputs are booleans.
Value predicate_match(const Invocation& inv, Args& args) {
  if (const double* d = std::get_if<double>(&args.at(0))) {
    return *d == conversion::to_number(args.at(1), inv.doc);
  }
  return conversion::to_boolean(args.at(0), inv.doc);
}

Value to_boolean(const Invocation& inv, Args& args) {
  return conversion::to_boolean(args.at(0), inv.doc);
}

Value to_number(const Invocation& inv, Args& args) {
  return conversion::to_number(args.at(0), inv.doc);
}

Value to_string(const Invocation& inv, Args& args) {
  return conversion::to_string(args.at(0), inv.doc);
}

bool values_equal(const Invocation& inv, const Value& left, const Value& right) {
  auto pair = conversion::to_compatible_types(left, right, inv.doc);
  if (const bool* b = std::get_if<bool>(&pair.first)) return *b == std::get<bool>(pair.second);
  if (const double* d = std::get_if<double>(&pair.first)) return *d == std::get<double>(pair.second);
  return std::get<std::string>(pair.first) == std::get<std::string>(pair.second);
}

Value compare_eq(const Invocation& inv, Args& args) {
  return values_equal(inv, args.at(0), args.at(1));
}

Value compare_neq(const Invocation& inv, Args& args) {
  // WHY: NaN compares unequal to everything, so != is not simply !(=) for numbers.
  auto pair = conversion::to_compatible_types(args.at(0), args.at(1), inv.doc);
  if (const double* d = std::get_if<double>(&pair.first)) return *d != std::get<double>(pair.second);
  return !values_equal(inv, args.at(0), args.at(1));
}

template <typename Op>
Value compare_numbers(const Invocation& inv, Args& args, Op op) {
  auto pair = conversion::to_compatible_types(args.at(0), args.at(1), inv.doc);
  return op(conversion::to_number(pair.first, inv.doc), conversion::to_number(pair.second, inv.doc));
}

Value compare_lt(const Invocation& inv, Args& args) {
  return compare_numbers(inv, args, [](double a, double b) { return a < b; });
}

Value compare_gt(const Invocation& inv, Args& args) {
  return compare_numbers(inv, args, [](double a, double b) { return a > b; });
}

Value compare_lte(const Invocation& inv, Args& args) {
  return compare_numbers(inv, args, [](double a, double b) { return a <= b; });
}

Value compare_gte(const Invocation& inv, Args& args) {
  return compare_numbers(inv, args, [](double a, double b) { return a >= b; });
}

Value add(const Invocation& inv, Args& args) {
  return conversion::to_number(args.at(0), inv.doc) + conversion::to_number(args.at(1), inv.doc);
}

Value subtract(const Invocation& inv, Args& args) {
  return conversion::to_number(args.at(0), inv.doc) - conversion::to_number(args.at(1), inv.doc);
}

Value multiply(const Invocation& inv, Args& args) {
  return conversion::to_number(args.at(0), inv.doc) * conversion::to_number(args.at(1), inv.doc);
}

Value divide(const Invocation& inv, Args& args) {
  return conversion::to_number(args.at(0), inv.doc) / conversion::to_number(args.at(1), inv.doc);
}

Value modulo(const Invocation& inv, Args& args) {
  return std::fmod(conversion::to_number(args.at(0), inv.doc),
                   conversion::to_number(args.at(1), inv.doc));
}

Value negate(const Invocation& inv, Args& args) {
  return -conversion::to_number(args.at(0), inv.doc);
}

Value variable(const Invocation& inv, Args& args) {
  const std::string& name = std::get<std::string>(args.at(0));
  auto it = inv.variables.find(name);
  if (it == inv.variables.end()) {
    throw EvaluationError("Undefined variable $" + name, "", "$" + name);
  }
  // Node ids index inv.doc, so a node-set from another document cannot be used.
  const NodeSet* set = std::get_if<NodeSet>(&it->second);
  if (set && !set->empty() && set->document != &inv.doc) {
    throw EvaluationError("Variable $" + name + " holds nodes from another document", "", "$" + name);
  }
  return from_query_value(it->second);
}

void push(const Invocation&, Value& receiver, Args& args) {
  NodeList* list = std::get_if<NodeList>(&receiver);
  if (!list) {
    throw NodeTypeError("push requires a node-set receiver", value_type_name(receiver), "push");
  }
  const Value& item = args.at(0);
  if (const NodeRef* node = std::get_if<NodeRef>(&item)) {
    list->push_back(node->id);
    return;
  }
  NodeList more = expect_node_set(item, "push");
  list->insert(list->end(), more.begin(), more.end());
}

}  // namespace

int64_t expect_node(const Value& value, const char* operation) {
  if (const NodeRef* node = std::get_if<NodeRef>(&value)) return node->id;
  throw NodeTypeError(std::string("Expected a node for ") + operation + ", got " + value_type_name(value),
                      value_type_name(value), operation);
}

NodeList expect_node_set(const Value& value, const char* operation) {
  if (const NodeList* list = std::get_if<NodeList>(&value)) return *list;
  if (const NodeRef* node = std::get_if<NodeRef>(&value)) return NodeList{node->id};
  throw NodeTypeError(std::string("Expected a node-set for ") + operation + ", got " + value_type_name(value),
                      value_type_name(value), operation);
}

void sort_document_order(const XmlDocument& doc, NodeList& nodes) {
  std::sort(nodes.begin(), nodes.end(), [&](int64_t a, int64_t b) {
    return doc.nodes[static_cast<size_t>(a)].doc_order < doc.nodes[static_cast<size_t>(b)].doc_order;
  });
  nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
}

Intrinsic find_builtin(const std::string& name) {
  static const std::unordered_map<std::string, Intrinsic> kBuiltins = {
      {"children", children},
      {"attributes", attributes},
      {"parent", parent},
      {"descendants", descendants},
      {"descendants_or_self", descendants_or_self},
      {"ancestors", ancestors},
      {"ancestors_or_self", ancestors_or_self},
      {"following_siblings", following_siblings},
      {"preceding_siblings", preceding_siblings},
      {"following", following},
      {"preceding", preceding},
      {"root", root},
      {"is_a", is_a},
      {"local_name", local_name},
      {"namespace_uri", namespace_uri},
      {"namespace_prefix", namespace_prefix},
      {"present", present},
      {"name_equals_ci", name_equals_ci},
      {"count", count},
      {"sort_unique", sort_unique},
      {"node_set", node_set},
      {"predicate_match", predicate_match},
      {"to_boolean", to_boolean},
      {"to_number", to_number},
      {"to_string", to_string},
      {"compare_eq", compare_eq},
      {"compare_neq", compare_neq},
      {"compare_lt", compare_lt},
      {"compare_gt", compare_gt},
      {"compare_lte", compare_lte},
      {"compare_gte", compare_gte},
      {"add", add},
      {"subtract", subtract},
      {"multiply", multiply},
      {"divide", divide},
      {"modulo", modulo},
      {"negate", negate},
      {"variable", variable},
  };
  auto it = kBuiltins.find(name);
  return it == kBuiltins.end() ? nullptr : it->second;
}

ReceiverIntrinsic find_receiver_builtin(const std::string& name) {
  if (name == "push") return push;
  return nullptr;
}

std::optional<Value> resolve_constant(const std::string& name) {
  static const std::unordered_map<std::string, NodeKind> kKinds = {
      {"Document", NodeKind::Document},
      {"Element", NodeKind::Element},
      {"Text", NodeKind::Text},
      {"CData", NodeKind::CData},
      {"Comment", NodeKind::Comment},
      {"ProcessingInstruction", NodeKind::ProcessingInstruction},
      {"Attribute", NodeKind::Attribute},
      {"Namespace", NodeKind::Namespace},
  };
  auto it = kKinds.find(name);
  if (it == kKinds.end()) return std::nullopt;
  return Value(std::string(node_kind_name(it->second)));
}

}  // namespace xpathq::runtime
