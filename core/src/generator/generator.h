#pragma once

#include <string>

#include "../compiler/code_ast.h"

namespace xpathq {

/// Renders a code tree as readable pseudo-C++ source for explain output.
/// MUST be deterministic so identical trees render identically.
/// Inputs are code trees rooted at a Block; outputs are source text.
std::string render_source(const CodeNode& root);

}  // namespace xpathq
