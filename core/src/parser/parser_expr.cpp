#include "parser_internal.h"

#include <cstdlib>

namespace xpathq {

/// Folds a binary operator onto the left operand.
/// MUST reject trees deeper than kMaxExpressionDepth so later passes stay bounded.
/// Inputs are operator/operands; outputs are left rewritten or errors.
bool Parser::join(AstType type, AstPtr& left, AstPtr right) {
  left = make_ast(type, {std::move(left), std::move(right)});
  return within_depth(left);
}

bool Parser::within_depth(const AstPtr& node) {
  if (node->depth > kMaxExpressionDepth) return set_error("Expression nested too deeply");
  return true;
}

/// Parses an expression with OR precedence.
/// MUST build nodes in left-associative order.
/// Inputs are tokens; outputs are trees or errors.
bool Parser::parse_or_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_and_expr(left)) return false;
  while (current_.type == TokenType::KeywordOr) {
    advance();
    AstPtr right;
    if (!parse_and_expr(right)) return false;
    if (!join(AstType::Or, left, right)) return false;
  }
  out = left;
  return true;
}

bool Parser::parse_and_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_equality_expr(left)) return false;
  while (current_.type == TokenType::KeywordAnd) {
    advance();
    AstPtr right;
    if (!parse_equality_expr(right)) return false;
    if (!join(AstType::And, left, right)) return false;
  }
  out = left;
  return true;
}

bool Parser::parse_equality_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_relational_expr(left)) return false;
  while (current_.type == TokenType::Equal || current_.type == TokenType::NotEqual) {
    AstType type = current_.type == TokenType::Equal ? AstType::Eq : AstType::Neq;
    advance();
    AstPtr right;
    if (!parse_relational_expr(right)) return false;
    if (!join(type, left, right)) return false;
  }
  out = left;
  return true;
}

bool Parser::parse_relational_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_additive_expr(left)) return false;
  while (true) {
    AstType type;
    switch (current_.type) {
      case TokenType::Less: type = AstType::Lt; break;
      case TokenType::Greater: type = AstType::Gt; break;
      case TokenType::LessEqual: type = AstType::Lte; break;
      case TokenType::GreaterEqual: type = AstType::Gte; break;
      default:
        out = left;
        return true;
    }
    advance();
    AstPtr right;
    if (!parse_additive_expr(right)) return false;
    if (!join(type, left, right)) return false;
  }
}

bool Parser::parse_additive_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_multiplicative_expr(left)) return false;
  while (current_.type == TokenType::Plus || current_.type == TokenType::Minus) {
    AstType type = current_.type == TokenType::Plus ? AstType::Plus : AstType::Minus;
    advance();
    AstPtr right;
    if (!parse_multiplicative_expr(right)) return false;
    if (!join(type, left, right)) return false;
  }
  out = left;
  return true;
}

/// Parses *, div and mod.
/// MUST treat '*' here as multiplication since an operand was just read.
/// Inputs are tokens; outputs are trees or errors.
bool Parser::parse_multiplicative_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_unary_expr(left)) return false;
  while (true) {
    AstType type;
    switch (current_.type) {
      case TokenType::Star: type = AstType::Multiply; break;
      case TokenType::KeywordDiv: type = AstType::Div; break;
      case TokenType::KeywordMod: type = AstType::Mod; break;
      default:
        out = left;
        return true;
    }
    advance();
    AstPtr right;
    if (!parse_unary_expr(right)) return false;
    if (!join(type, left, right)) return false;
  }
}

/// Parses unary minus and everything below it.
/// MUST bound recursion: parenthesized operands, arguments and predicates all pass here.
/// Inputs are tokens; outputs are trees or errors.
bool Parser::parse_unary_expr(AstPtr& out) {
  if (nesting_ >= kMaxExpressionDepth) return set_error("Expression nested too deeply");
  ++nesting_;
  bool ok;
  if (current_.type == TokenType::Minus) {
    advance();
    AstPtr operand;
    ok = parse_unary_expr(operand);
    if (ok) {
      out = make_ast(AstType::Negate, {operand});
      ok = within_depth(out);
    }
  } else {
    ok = parse_union_expr(out) && within_depth(out);
  }
  --nesting_;
  return ok;
}

bool Parser::parse_union_expr(AstPtr& out) {
  AstPtr left;
  if (!parse_path_expr(left)) return false;
  while (current_.type == TokenType::Pipe) {
    advance();
    AstPtr right;
    if (!parse_path_expr(right)) return false;
    if (!join(AstType::Union, left, right)) return false;
  }
  out = left;
  return true;
}

/// Parses a path expression: absolute path, filter expression or relative path.
/// MUST try a primary expression before falling back to a location path.
/// Inputs are tokens; outputs are trees or errors.
bool Parser::parse_path_expr(AstPtr& out) {
  if (current_.type == TokenType::Slash || current_.type == TokenType::DoubleSlash) {
    return parse_location_path(out);
  }
  if (!starts_primary()) {
    return parse_location_path(out);
  }

  AstPtr primary;
  if (!parse_primary_expr(primary)) return false;
  std::vector<AstPtr> predicates;
  if (!parse_predicates(predicates)) return false;
  if (!predicates.empty()) {
    std::vector<AstPtr> children;
    children.reserve(predicates.size() + 1);
    children.push_back(primary);
    for (auto& predicate : predicates) children.push_back(predicate);
    primary = make_ast(AstType::FilterExpr, std::move(children));
  }

  if (current_.type != TokenType::Slash && current_.type != TokenType::DoubleSlash) {
    out = primary;
    return true;
  }
  std::vector<AstPtr> steps;
  if (current_.type == TokenType::DoubleSlash) {
    steps.push_back(descendant_or_self_step());
  }
  advance();
  if (!parse_relative_steps(steps)) return false;
  out = make_ast(AstType::Path, {primary, make_ast(AstType::RelativePath, std::move(steps))});
  return true;
}

bool Parser::starts_primary() {
  switch (current_.type) {
    case TokenType::Dollar:
    case TokenType::LParen:
    case TokenType::String:
    case TokenType::Number:
      return true;
    case TokenType::Name:
      return peek().type == TokenType::LParen;
    default:
      return false;
  }
}

bool Parser::parse_primary_expr(AstPtr& out) {
  switch (current_.type) {
    case TokenType::Dollar: {
      advance();
      if (current_.type != TokenType::Name && current_.type != TokenType::NodeType &&
          current_.type != TokenType::KeywordAnd && current_.type != TokenType::KeywordOr &&
          current_.type != TokenType::KeywordMod && current_.type != TokenType::KeywordDiv) {
        return set_error("Expected variable name after '$'");
      }
      out = make_ast_text(AstType::Variable, current_.text);
      advance();
      return true;
    }
    case TokenType::LParen: {
      advance();
      AstPtr inner;
      if (!parse_or_expr(inner)) return false;
      if (!consume(TokenType::RParen, "Expected ) to close expression")) return false;
      out = inner;
      return true;
    }
    case TokenType::String:
      out = make_ast_text(AstType::String, current_.text);
      advance();
      return true;
    case TokenType::Number:
      out = make_ast_number(std::strtod(current_.text.c_str(), nullptr));
      advance();
      return true;
    case TokenType::Name:
      return parse_function_call(out);
    default:
      return set_error("Expected expression");
  }
}

/// Parses name(arg, ...) into a Function node.
/// MUST accept an empty argument list and MUST require the closing paren.
/// Inputs are tokens; outputs are trees or errors.
bool Parser::parse_function_call(AstPtr& out) {
  std::string name = current_.text;
  advance();
  if (!consume(TokenType::LParen, "Expected ( after function name")) return false;
  std::vector<AstPtr> args;
  if (current_.type != TokenType::RParen) {
    AstPtr arg;
    if (!parse_or_expr(arg)) return false;
    args.push_back(arg);
    while (current_.type == TokenType::Comma) {
      advance();
      if (!parse_or_expr(arg)) return false;
      args.push_back(arg);
    }
  }
  if (!consume(TokenType::RParen, "Expected ) to close call to " + name + "()")) return false;
  out = make_ast_text(AstType::Function, name, std::move(args));
  return true;
}

bool Parser::parse_predicates(std::vector<AstPtr>& out) {
  while (current_.type == TokenType::LBracket) {
    advance();
    AstPtr expr;
    if (!parse_or_expr(expr)) return false;
    if (!consume(TokenType::RBracket, "Expected ] to close predicate")) return false;
    out.push_back(make_ast(AstType::Predicate, {expr}));
  }
  return true;
}

}  // namespace xpathq
