#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "../compiler/code_ast.h"
#include "runtime.h"

namespace xpathq {

namespace runtime {

/// Variable storage for one run of a loaded query.
struct Frame {
  std::vector<Value> slots;
};

using Thunk = std::function<Value(Frame&, const Invocation&)>;

}  // namespace runtime

/// A code tree turned into directly callable closures.
/// MUST NOT hold per-run state; each run allocates its own Frame.
/// Inputs are built by EvaluationContext::load; outputs are read by run().
struct LoadedQuery {
  runtime::Thunk entry;
  size_t slot_count = 0;
  size_t context_slot = 0;
};

namespace runtime {

/// Loads generated code into closures, resolving intrinsics and variables once.
/// MUST reject unknown intrinsics and constants with EvaluationError at load time.
/// Inputs are code trees rooted at a one-parameter Block; outputs are LoadedQuery.
class EvaluationContext {
 public:
  std::shared_ptr<const LoadedQuery> load(const CodeNode& root);

 private:
  Thunk load_node(const CodeNode& node);
  Thunk load_call(const CodeNode& node);
  Thunk load_loop(const CodeNode& node);
  std::vector<Thunk> load_children(const CodeNode& node, size_t first);
  size_t slot_for(const std::string& name);

  std::unordered_map<std::string, size_t> slots_;
};

/// Runs a loaded query with context_id bound to the context parameter.
Value run(const LoadedQuery& loaded, const Invocation& inv, int64_t context_id);

}  // namespace runtime

}  // namespace xpathq
