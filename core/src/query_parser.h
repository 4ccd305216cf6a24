#pragma once

#include <optional>
#include <string>

#include "ast.h"

namespace xpathq {

/// Describes a parse failure with a message, byte position and offending token.
/// MUST report positions relative to the original input string.
/// Inputs are parser diagnostics; outputs are error details only.
struct ParseError {
  std::string message;
  size_t position = 0;
  std::string token;
};

/// Wraps either a parsed tree or a ParseError.
/// MUST contain exactly one of ast or error.
/// Inputs are parser outputs; side effects are none.
struct ParseResult {
  AstPtr ast;
  std::optional<ParseError> error;
};

/// Parses an expression into an immutable tree.
/// MUST return errors without throwing on invalid syntax.
/// Inputs are expression text; outputs are ParseResult with optional error.
ParseResult parse_expression(const std::string& input);

}  // namespace xpathq
