#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../query_parser.h"
#include "lexer.h"

namespace xpathq {

/// Deepest expression tree and deepest operand nesting the parser accepts.
constexpr size_t kMaxExpressionDepth = 256;

class Parser {
 public:
  explicit Parser(const std::string& input);
  ParseResult parse();

 private:
  bool parse_or_expr(AstPtr& out);
  bool parse_and_expr(AstPtr& out);
  bool parse_equality_expr(AstPtr& out);
  bool parse_relational_expr(AstPtr& out);
  bool parse_additive_expr(AstPtr& out);
  bool parse_multiplicative_expr(AstPtr& out);
  bool parse_unary_expr(AstPtr& out);
  bool parse_union_expr(AstPtr& out);
  bool parse_path_expr(AstPtr& out);
  bool parse_primary_expr(AstPtr& out);
  bool parse_function_call(AstPtr& out);
  bool parse_predicates(std::vector<AstPtr>& out);

  bool parse_location_path(AstPtr& out);
  bool parse_relative_steps(std::vector<AstPtr>& steps);
  bool parse_step(AstPtr& out);
  bool parse_node_test(AstPtr& out);
  bool starts_step() const;
  bool starts_primary();

  bool join(AstType type, AstPtr& left, AstPtr right);
  bool within_depth(const AstPtr& node);

  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  ParseResult error_result();

  void advance();
  Token peek();

  static AstPtr descendant_or_self_step();

  Lexer lexer_;
  Token current_{};
  Token peek_{};
  bool has_peek_ = false;
  size_t nesting_ = 0;
  std::optional<ParseError> error_;
};

}  // namespace xpathq
