#include "parser_internal.h"

namespace xpathq {

namespace {

bool is_name_like(TokenType type) {
  return type == TokenType::Name || type == TokenType::NodeType ||
         type == TokenType::KeywordAnd || type == TokenType::KeywordOr ||
         type == TokenType::KeywordMod || type == TokenType::KeywordDiv;
}

}  // namespace

/// Parses absolute or relative location paths.
/// MUST expand '//' into an explicit descendant-or-self::node() step.
/// Inputs are tokens; outputs are AbsolutePath/RelativePath trees or errors.
bool Parser::parse_location_path(AstPtr& out) {
  std::vector<AstPtr> steps;
  if (current_.type == TokenType::Slash) {
    advance();
    // WHY: a lone "/" selects the root; it is followed by an operator or the end.
    if (!starts_step()) {
      out = make_ast(AstType::AbsolutePath);
      return true;
    }
    if (!parse_relative_steps(steps)) return false;
    out = make_ast(AstType::AbsolutePath, std::move(steps));
    return true;
  }
  if (current_.type == TokenType::DoubleSlash) {
    advance();
    steps.push_back(descendant_or_self_step());
    if (!parse_relative_steps(steps)) return false;
    out = make_ast(AstType::AbsolutePath, std::move(steps));
    return true;
  }
  if (!parse_relative_steps(steps)) return false;
  out = make_ast(AstType::RelativePath, std::move(steps));
  return true;
}

bool Parser::parse_relative_steps(std::vector<AstPtr>& steps) {
  AstPtr step;
  if (!parse_step(step)) return false;
  steps.push_back(step);
  while (current_.type == TokenType::Slash || current_.type == TokenType::DoubleSlash) {
    if (current_.type == TokenType::DoubleSlash) {
      steps.push_back(descendant_or_self_step());
    }
    advance();
    if (!parse_step(step)) return false;
    steps.push_back(step);
  }
  return true;
}

bool Parser::starts_step() const {
  switch (current_.type) {
    case TokenType::Dot:
    case TokenType::DoubleDot:
    case TokenType::At:
    case TokenType::Star:
    case TokenType::AxisName:
      return true;
    default:
      return is_name_like(current_.type);
  }
}

/// Parses one step: abbreviations, explicit axes or a default child step.
/// MUST reject unknown axis names and MUST attach trailing predicates.
/// Inputs are tokens; outputs are Axis trees or errors.
bool Parser::parse_step(AstPtr& out) {
  if (current_.type == TokenType::Dot) {
    advance();
    out = make_ast_text(AstType::Axis, "self", {make_ast_text(AstType::NodeType, "node")});
    return true;
  }
  if (current_.type == TokenType::DoubleDot) {
    advance();
    out = make_ast_text(AstType::Axis, "parent", {make_ast_text(AstType::NodeType, "node")});
    return true;
  }

  std::string axis = "child";
  if (current_.type == TokenType::AxisName) {
    if (!axis_from_name(current_.text).has_value()) {
      return set_error("Unknown axis '" + current_.text + "'");
    }
    axis = current_.text;
    advance();
    if (!consume(TokenType::DoubleColon, "Expected :: after axis name")) return false;
  } else if (current_.type == TokenType::At) {
    axis = "attribute";
    advance();
  } else if (!starts_step()) {
    return set_error("Expected location step");
  }

  std::vector<AstPtr> children;
  AstPtr test;
  if (!parse_node_test(test)) return false;
  children.push_back(test);
  if (!parse_predicates(children)) return false;
  out = make_ast_text(AstType::Axis, axis, std::move(children));
  return true;
}

/// Parses a node test: wildcard, node type, prefix:* or [prefix:]local.
/// MUST re-admit operator keywords and bare node-type names as element names.
/// Inputs are tokens; outputs are Wildcard/NodeType/Test trees or errors.
bool Parser::parse_node_test(AstPtr& out) {
  if (current_.type == TokenType::Star) {
    advance();
    out = make_ast(AstType::Wildcard);
    return true;
  }
  if (current_.type == TokenType::NodeType && peek().type == TokenType::LParen) {
    std::string type = current_.text;
    advance();
    advance();
    std::vector<AstPtr> children;
    if (type == "processing-instruction" && current_.type == TokenType::String) {
      children.push_back(make_ast_text(AstType::String, current_.text));
      advance();
    }
    if (!consume(TokenType::RParen, "Expected ) after " + type + "(")) return false;
    out = make_ast_text(AstType::NodeType, type, std::move(children));
    return true;
  }
  if (!is_name_like(current_.type)) {
    return set_error("Expected node test");
  }
  std::string name = current_.text;
  advance();
  auto test = std::make_shared<AstNode>();
  test->type = AstType::Test;
  if (current_.type == TokenType::Colon) {
    advance();
    if (current_.type == TokenType::Star) {
      test->prefix = name;
      test->text = "*";
      advance();
    } else if (is_name_like(current_.type)) {
      test->prefix = name;
      test->text = current_.text;
      advance();
    } else {
      return set_error("Expected local name after '" + name + ":'");
    }
  } else {
    test->text = name;
  }
  out = test;
  return true;
}

}  // namespace xpathq
