#pragma once

#include <string>
#include <utility>

#include "runtime/value.h"

namespace xpathq::conversion {

/// Formats a number the way XPath string() does.
/// MUST print integral values without a fraction and MUST spell NaN/Infinity.
/// Inputs are doubles; outputs are strings with no side effects.
std::string format_number(double value);
/// Parses XPath number syntax after trimming whitespace.
/// MUST return NaN instead of throwing on malformed text.
/// Inputs are strings; outputs are doubles.
double parse_number(const std::string& text);

/// Returns the string-value of the first node of a node-set, or "" when empty.
std::string first_node_text(const runtime::NodeList& nodes, const XmlDocument& doc);

std::string to_string(const runtime::Value& value, const XmlDocument& doc);
double to_number(const runtime::Value& value, const XmlDocument& doc);
/// Converts a value to boolean using XPath 1.0 rules.
/// MUST treat NaN and 0 as false, "" as false and empty node-sets as false.
/// Inputs are value/doc; outputs are booleans.
bool to_boolean(const runtime::Value& value, const XmlDocument& doc);

/// Coerces two comparison operands into the same type.
/// MUST reduce node-sets and nodes to the first node's string value first,
/// then prefer number, then string, then boolean.
/// Inputs are both operands; outputs are the coerced pair.
std::pair<runtime::Value, runtime::Value> to_compatible_types(const runtime::Value& left,
                                                              const runtime::Value& right,
                                                              const XmlDocument& doc);

}  // namespace xpathq::conversion
