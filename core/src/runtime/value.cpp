#include "value.h"

namespace xpathq::runtime {

QueryValue to_query_value(const Value& value, const XmlDocument& doc) {
  if (const NodeList* list = std::get_if<NodeList>(&value)) {
    return NodeSet{&doc, *list};
  }
  if (const NodeRef* node = std::get_if<NodeRef>(&value)) {
    return NodeSet{&doc, {node->id}};
  }
  if (const bool* b = std::get_if<bool>(&value)) return *b;
  if (const double* d = std::get_if<double>(&value)) return *d;
  if (const std::string* s = std::get_if<std::string>(&value)) return *s;
  return std::string();
}

Value from_query_value(const QueryValue& value) {
  if (const NodeSet* set = std::get_if<NodeSet>(&value)) return set->ids;
  if (const bool* b = std::get_if<bool>(&value)) return *b;
  if (const double* d = std::get_if<double>(&value)) return *d;
  return std::get<std::string>(value);
}

const char* value_type_name(const Value& value) {
  switch (value.index()) {
    case 0: return "nil";
    case 1: return "boolean";
    case 2: return "number";
    case 3: return "string";
    case 4: return "node";
    default: return "node-set";
  }
}

}  // namespace xpathq::runtime
