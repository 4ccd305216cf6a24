#include "parser_internal.h"

namespace xpathq {

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type/message; outputs are success or error.
bool Parser::consume(TokenType type, const std::string& message) {
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return true;
}

/// Records the first parse error for reporting.
/// MUST preserve the earliest error and MUST prefer lexer diagnostics.
/// Inputs are error message; outputs are false with stored error.
bool Parser::set_error(const std::string& message) {
  if (error_.has_value()) return false;
  if (current_.type == TokenType::Error) {
    bool unterminated = !current_.text.empty() &&
                        (current_.text[0] == '\'' || current_.text[0] == '"');
    std::string detail = unterminated ? "Unterminated string literal"
                                      : "Unexpected character '" + current_.text + "'";
    error_ = ParseError{detail, current_.pos, current_.text};
    return false;
  }
  error_ = ParseError{message, current_.pos, current_.text};
  return false;
}

/// Produces a ParseResult using the recorded error.
/// MUST return an empty tree with the stored error.
/// Inputs are internal state; outputs are ParseResult.
ParseResult Parser::error_result() {
  ParseResult res;
  res.error = error_;
  return res;
}

/// Advances to the next token in the input stream.
/// MUST be called after consuming tokens to keep state in sync.
/// Inputs are internal state; outputs are updated current_.
void Parser::advance() {
  if (has_peek_) {
    current_ = peek_;
    has_peek_ = false;
    return;
  }
  current_ = lexer_.next();
}

/// Peeks one token ahead without consuming it.
/// MUST preserve current_ and return a cached lookahead.
/// Inputs are internal state; outputs are peek token.
Token Parser::peek() {
  if (!has_peek_) {
    peek_ = lexer_.next();
    has_peek_ = true;
  }
  return peek_;
}

AstPtr Parser::descendant_or_self_step() {
  return make_ast_text(AstType::Axis, "descendant-or-self",
                       {make_ast_text(AstType::NodeType, "node")});
}

}  // namespace xpathq
