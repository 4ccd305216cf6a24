#pragma once

#include <optional>
#include <string>
#include <vector>

#include "value.h"

namespace xpathq::runtime {

/// Per-call state visible to intrinsics.
/// MUST only borrow the document and variables for the duration of one call.
/// Inputs are evaluate() arguments; outputs are read by intrinsics.
struct Invocation {
  const XmlDocument& doc;
  const VariableBindings& variables;
};

using Args = std::vector<Value>;
using Intrinsic = Value (*)(const Invocation&, Args&);
using ReceiverIntrinsic = void (*)(const Invocation&, Value& receiver, Args&);

/// Finds a navigation, set, conversion or operator intrinsic by name.
/// MUST return nullptr for unknown names so the loader can reject them.
/// Inputs are names; outputs are function pointers.
Intrinsic find_builtin(const std::string& name);
/// Finds an intrinsic that mutates its receiver in place (push).
ReceiverIntrinsic find_receiver_builtin(const std::string& name);
/// Finds an XPath core function implementation registered as "fn:<name>".
/// Every function receives the context node as its first argument.
Intrinsic find_function(const std::string& name);

/// Resolves a constant referenced by generated code.
/// MUST return nullopt for unknown constants.
/// Inputs are constant names (node kinds); outputs are values.
std::optional<Value> resolve_constant(const std::string& name);

/// Extracts a node id from a value or raises NodeTypeError naming operation.
int64_t expect_node(const Value& value, const char* operation);
/// Extracts a node list (a single node counts as one) or raises NodeTypeError.
NodeList expect_node_set(const Value& value, const char* operation);

/// Sorts ids into document order and removes duplicates.
void sort_document_order(const XmlDocument& doc, NodeList& nodes);

}  // namespace xpathq::runtime
