#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "xpathq/xpathq.h"

namespace xpathq::runtime {

/// Borrowed reference to one node of the document being queried.
struct NodeRef {
  int64_t id = 0;
};

/// Ordered node ids; document order once passed through sort_unique.
using NodeList = std::vector<int64_t>;

/// Runtime value flowing through loaded code.
/// monostate is nil (missing parent, empty lookups).
using Value = std::variant<std::monostate, bool, double, std::string, NodeRef, NodeList>;

/// Converts a runtime value into the public result type.
/// MUST map nil to the empty string and single nodes to one-element node-sets.
/// Inputs are value/doc; outputs are QueryValue.
QueryValue to_query_value(const Value& value, const XmlDocument& doc);
/// Converts a bound variable into a runtime value.
Value from_query_value(const QueryValue& value);

/// Names the runtime type of a value for diagnostics.
const char* value_type_name(const Value& value);

}  // namespace xpathq::runtime
