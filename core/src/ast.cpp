#include "ast.h"

#include <cstdio>

namespace xpathq {

namespace {

struct AxisEntry {
  const char* name;
  Axis axis;
};

const AxisEntry kAxes[] = {
    {"child", Axis::Child},
    {"descendant", Axis::Descendant},
    {"descendant-or-self", Axis::DescendantOrSelf},
    {"self", Axis::Self},
    {"parent", Axis::Parent},
    {"ancestor", Axis::Ancestor},
    {"ancestor-or-self", Axis::AncestorOrSelf},
    {"attribute", Axis::Attribute},
    {"following-sibling", Axis::FollowingSibling},
    {"preceding-sibling", Axis::PrecedingSibling},
    {"following", Axis::Following},
    {"preceding", Axis::Preceding},
    {"namespace", Axis::Namespace},
};

void quote(const std::string& s, std::string& out) {
  out += '"';
  for (char c : s) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

void write_sexpr(const AstNode& node, std::string& out) {
  out += '(';
  out += ast_type_name(node.type);
  if (node.type == AstType::Number) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), " %.17g", node.number);
    out += buf;
  }
  if (!node.prefix.empty() || node.type == AstType::Test) {
    out += ' ';
    quote(node.prefix, out);
  }
  if (!node.text.empty() || node.type == AstType::String) {
    out += ' ';
    quote(node.text, out);
  }
  for (const auto& child : node.children) {
    out += ' ';
    write_sexpr(*child, out);
  }
  out += ')';
}

size_t subtree_depth(const std::vector<AstPtr>& children) {
  size_t deepest = 0;
  for (const auto& child : children) {
    if (child && child->depth > deepest) deepest = child->depth;
  }
  return deepest + 1;
}

}  // namespace

std::optional<Axis> axis_from_name(const std::string& name) {
  for (const auto& entry : kAxes) {
    if (name == entry.name) return entry.axis;
  }
  return std::nullopt;
}

AstPtr make_ast(AstType type, std::vector<AstPtr> children) {
  auto node = std::make_shared<AstNode>();
  node->type = type;
  node->children = std::move(children);
  node->depth = subtree_depth(node->children);
  return node;
}

AstPtr make_ast_text(AstType type, std::string text, std::vector<AstPtr> children) {
  auto node = std::make_shared<AstNode>();
  node->type = type;
  node->text = std::move(text);
  node->children = std::move(children);
  node->depth = subtree_depth(node->children);
  return node;
}

AstPtr make_ast_number(double value) {
  auto node = std::make_shared<AstNode>();
  node->type = AstType::Number;
  node->number = value;
  return node;
}

const char* ast_type_name(AstType type) {
  switch (type) {
    case AstType::AbsolutePath: return "absolute_path";
    case AstType::RelativePath: return "relative_path";
    case AstType::Path: return "path";
    case AstType::Axis: return "axis";
    case AstType::Test: return "test";
    case AstType::Wildcard: return "wildcard";
    case AstType::NodeType: return "node_type";
    case AstType::Predicate: return "predicate";
    case AstType::String: return "string";
    case AstType::Number: return "number";
    case AstType::Variable: return "variable";
    case AstType::Function: return "function";
    case AstType::Union: return "union";
    case AstType::FilterExpr: return "filter";
    case AstType::Or: return "or";
    case AstType::And: return "and";
    case AstType::Eq: return "eq";
    case AstType::Neq: return "neq";
    case AstType::Lt: return "lt";
    case AstType::Gt: return "gt";
    case AstType::Lte: return "lte";
    case AstType::Gte: return "gte";
    case AstType::Plus: return "plus";
    case AstType::Minus: return "minus";
    case AstType::Multiply: return "star";
    case AstType::Div: return "div";
    case AstType::Mod: return "mod";
    case AstType::Negate: return "negate";
  }
  return "unknown";
}

std::string ast_to_sexpr(const AstNode& node) {
  std::string out;
  write_sexpr(node, out);
  return out;
}

}  // namespace xpathq
