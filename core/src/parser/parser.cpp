#include "parser_internal.h"

namespace xpathq {

/// Constructs a parser for a given expression.
/// MUST immediately read the first token to initialize state.
/// Inputs are expression strings; side effects include token consumption.
Parser::Parser(const std::string& input) : lexer_(input) { advance(); }

/// Parses a full expression and returns either a tree or a ParseError.
/// MUST consume all tokens or report an unexpected trailing token.
/// Inputs are internal state; outputs are ParseResult.
ParseResult Parser::parse() {
  if (current_.type == TokenType::End) {
    set_error("Empty expression");
    return error_result();
  }
  AstPtr root;
  if (!parse_or_expr(root)) return error_result();
  if (current_.type != TokenType::End) {
    set_error("Unexpected token " + std::string(token_type_name(current_.type)) +
              (current_.text.empty() ? "" : " '" + current_.text + "'"));
    return error_result();
  }
  ParseResult res;
  res.ast = root;
  return res;
}

ParseResult parse_expression(const std::string& input) {
  Parser parser(input);
  return parser.parse();
}

}  // namespace xpathq
