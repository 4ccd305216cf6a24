#include "compiler.h"

#include <limits>

namespace xpathq {

using namespace code;

namespace {

struct FunctionSignature {
  const char* name;
  size_t min_args;
  size_t max_args;
};

constexpr size_t kVariadic = std::numeric_limits<size_t>::max();

const FunctionSignature kSignatures[] = {
    {"last", 0, 0},
    {"position", 0, 0},
    {"count", 1, 1},
    {"id", 1, 1},
    {"local-name", 0, 1},
    {"namespace-uri", 0, 1},
    {"name", 0, 1},
    {"string", 0, 1},
    {"concat", 2, kVariadic},
    {"starts-with", 2, 2},
    {"contains", 2, 2},
    {"substring-before", 2, 2},
    {"substring-after", 2, 2},
    {"substring", 2, 3},
    {"string-length", 0, 1},
    {"normalize-space", 0, 1},
    {"translate", 3, 3},
    {"boolean", 1, 1},
    {"not", 1, 1},
    {"true", 0, 0},
    {"false", 0, 0},
    {"lang", 1, 1},
    {"number", 0, 1},
    {"sum", 1, 1},
    {"floor", 1, 1},
    {"ceiling", 1, 1},
    {"round", 1, 1},
};

const FunctionSignature* find_signature(const std::string& name) {
  for (const auto& sig : kSignatures) {
    if (name == sig.name) return &sig;
  }
  return nullptr;
}

std::string arity_text(const FunctionSignature& sig) {
  if (sig.max_args == kVariadic) return "at least " + std::to_string(sig.min_args);
  if (sig.min_args == sig.max_args) return std::to_string(sig.min_args);
  return std::to_string(sig.min_args) + " to " + std::to_string(sig.max_args);
}

}  // namespace

/// Lowers a core function call against the current focus.
/// MUST reject unknown names and wrong arity with FunctionError at compile time.
/// Inputs are Function trees/focus; outputs are value-producing code.
CodePtr Compiler::on_function(const AstNode& ast, const Focus& focus) {
  const std::string& name = ast.text;
  size_t argc = ast.children.size();
  const FunctionSignature* sig = find_signature(name);
  if (!sig) {
    throw FunctionError("Unknown function: " + name + "()", name, argc);
  }
  if (argc < sig->min_args || argc > sig->max_args) {
    throw FunctionError("Function " + name + "() expects " + arity_text(*sig) + " argument(s), got " +
                            std::to_string(argc),
                        name, argc);
  }
  if (name == "last") return focus.size;
  if (name == "position") return focus.position;
  // Conversions lower to the shared intrinsics; the zero-argument forms read the context node.
  if (name == "boolean") return call("to_boolean", {process(*ast.children[0], focus)});
  if (name == "not") return not_(process(*ast.children[0], focus));
  if (name == "string" || name == "number") {
    CodePtr subject = argc == 0 ? focus.node : process(*ast.children[0], focus);
    return call(name == "string" ? "to_string" : "to_number", {subject});
  }

  std::vector<CodePtr> args;
  args.push_back(focus.node);
  for (const auto& child : ast.children) {
    args.push_back(process(*child, focus));
  }
  return call("fn:" + name, std::move(args));
}

}  // namespace xpathq
