#pragma once

#include <string>
#include <vector>

#include "tokens.h"

namespace xpathq {

/// Tokenizes expression text into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are expression strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  /// Inputs are the expression string; side effects are none.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST return End at input exhaustion and Error for invalid input.
  /// Inputs are internal state; outputs are tokens with positions.
  Token next();

 private:
  /// Lexes a quoted string literal, decoding backslash escapes.
  /// MUST return an Error token when the closing quote is missing.
  /// Inputs are internal state; outputs are string tokens.
  Token lex_string();
  /// Lexes names and classifies axis, node-type and operator keywords.
  /// MUST only classify an axis when the next non-space input is "::".
  /// Inputs are internal state; outputs are name-like tokens.
  Token lex_name();
  /// Lexes a decimal literal with an optional fractional part.
  /// MUST stop at the first non-digit and MUST NOT consume a sign.
  /// Inputs are internal state; outputs are number tokens.
  Token lex_number();
  void skip_ws();
  Token make(TokenType type, size_t start, size_t length);
  bool followed_by_double_colon() const;
  static bool is_name_start(char c);
  static bool is_name_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

/// Tokenizes a whole expression, stopping after the End or first Error token.
/// MUST include the terminating End/Error token as the last element.
/// Inputs are expression text; outputs are the token list.
std::vector<Token> tokenize(const std::string& input);

}  // namespace xpathq
