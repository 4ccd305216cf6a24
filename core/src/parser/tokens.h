#pragma once

#include <cstddef>
#include <string>

namespace xpathq {

/// Enumerates lexical tokens produced by the expression lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Slash,
  DoubleSlash,
  Pipe,
  Plus,
  Minus,
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  Star,
  LParen,
  RParen,
  LBracket,
  RBracket,
  Comma,
  At,
  Dollar,
  Dot,
  DoubleDot,
  Colon,
  DoubleColon,
  String,
  Number,
  Name,
  AxisName,
  NodeType,
  KeywordAnd,
  KeywordOr,
  KeywordMod,
  KeywordDiv,
  Error,
  End
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// Inputs are lexer output; outputs are consumed by the parser.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
};

/// Returns a printable label for a token type in diagnostics.
const char* token_type_name(TokenType type);

}  // namespace xpathq
