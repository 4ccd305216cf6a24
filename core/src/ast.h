#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "xpathq/xpathq.h"

namespace xpathq {

/// Enumerates parsed expression node kinds.
/// MUST have exactly one lowering rule per kind in the compiler.
/// Inputs are parser decisions; outputs are immutable tree tags.
enum class AstType {
  AbsolutePath,
  RelativePath,
  Path,
  Axis,
  Test,
  Wildcard,
  NodeType,
  Predicate,
  String,
  Number,
  Variable,
  Function,
  Union,
  FilterExpr,
  Or,
  And,
  Eq,
  Neq,
  Lt,
  Gt,
  Lte,
  Gte,
  Plus,
  Minus,
  Multiply,
  Div,
  Mod,
  Negate
};

/// Closed set of location-path axes.
enum class Axis {
  Child,
  Descendant,
  DescendantOrSelf,
  Self,
  Parent,
  Ancestor,
  AncestorOrSelf,
  Attribute,
  FollowingSibling,
  PrecedingSibling,
  Following,
  Preceding,
  Namespace
};

std::optional<Axis> axis_from_name(const std::string& name);

/// Immutable expression tree node shared between cache entries.
/// MUST NOT be mutated after construction; leaves carry literal data only.
/// Inputs are parser output; outputs are read by the compiler.
///
/// Field use per type:
///   Axis       text = axis name; children = node test, then predicates
///   Test       prefix/text = optional prefix and local name ("*" for prefix:*)
///   NodeType   text = type name; children = optional String target
///   Function   text = function name; children = arguments
///   Variable   text = variable name
///   String     text = literal value
///   Number     number = literal value
///   FilterExpr children = primary expression, then predicates
///   Path       children = filter/primary expression, then RelativePath
struct AstNode {
  AstType type;
  std::string text;
  std::string prefix;
  double number = 0;
  std::vector<AstPtr> children;
  // Height of the subtree rooted here; leaves are 1.
  size_t depth = 1;
};

AstPtr make_ast(AstType type, std::vector<AstPtr> children = {});
AstPtr make_ast_text(AstType type, std::string text, std::vector<AstPtr> children = {});
AstPtr make_ast_number(double value);

const char* ast_type_name(AstType type);

/// Serializes a tree to a canonical s-expression.
/// MUST be injective over distinct trees so it can key the compile cache.
/// Inputs are trees; outputs are strings with no side effects.
std::string ast_to_sexpr(const AstNode& node);

}  // namespace xpathq
