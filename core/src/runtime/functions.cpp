#include "runtime.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <unordered_map>

#include "../conversion.h"
#include "../util/string_util.h"

namespace xpathq::runtime {

namespace {

// Argument 0 is always the context node; XPath arguments start at index 1.
std::string str(const Invocation& inv, const Args& args, size_t index) {
  return conversion::to_string(args.at(index), inv.doc);
}

double num(const Invocation& inv, const Args& args, size_t index) {
  return conversion::to_number(args.at(index), inv.doc);
}

/// Picks the node a name function inspects: the first argument node or the context.
/// MUST return nullopt for an empty node-set argument.
/// Inputs are args and function name; outputs are optional node ids.
std::optional<int64_t> subject_node(const Invocation& inv, const Args& args, const char* fn) {
  if (args.size() < 2) {
    return expect_node(args.at(0), fn);
  }
  NodeList nodes = expect_node_set(args.at(1), fn);
  if (nodes.empty()) return std::nullopt;
  sort_document_order(inv.doc, nodes);
  return nodes.front();
}

double xpath_round(double value) {
  if (std::isnan(value) || std::isinf(value)) return value;
  return std::floor(value + 0.5);
}

Value fn_count(const Invocation&, Args& args) {
  return static_cast<double>(expect_node_set(args.at(1), "count()").size());
}

/// Selects elements whose id attribute matches any whitespace-separated token.
/// MUST tokenize each node's string-value when given a node-set.
/// Inputs are context/value; outputs are node lists in document order.
Value fn_id(const Invocation& inv, Args& args) {
  std::vector<std::string> sources;
  const Value& arg = args.at(1);
  if (std::holds_alternative<NodeList>(arg) || std::holds_alternative<NodeRef>(arg)) {
    for (int64_t id : expect_node_set(arg, "id()")) {
      sources.push_back(string_value(inv.doc, id));
    }
  } else {
    sources.push_back(conversion::to_string(arg, inv.doc));
  }
  std::vector<std::string> tokens;
  for (const auto& source : sources) {
    std::istringstream iss(source);
    std::string token;
    while (iss >> token) tokens.push_back(token);
  }
  NodeList out;
  for (const auto& node : inv.doc.nodes) {
    if (node.kind != NodeKind::Element) continue;
    for (int64_t attr_id : node.attributes) {
      const XmlNode& attr = inv.doc.nodes[static_cast<size_t>(attr_id)];
      if (attr.name != "id" && attr.name != "xml:id") continue;
      if (std::find(tokens.begin(), tokens.end(), attr.value) != tokens.end()) {
        out.push_back(node.id);
        break;
      }
    }
  }
  sort_document_order(inv.doc, out);
  return out;
}

Value fn_local_name(const Invocation& inv, Args& args) {
  auto id = subject_node(inv, args, "local-name()");
  return id ? node_at(inv.doc, *id).local_name : std::string();
}

Value fn_namespace_uri(const Invocation& inv, Args& args) {
  auto id = subject_node(inv, args, "namespace-uri()");
  return id ? node_at(inv.doc, *id).namespace_uri : std::string();
}

Value fn_name(const Invocation& inv, Args& args) {
  auto id = subject_node(inv, args, "name()");
  return id ? node_at(inv.doc, *id).name : std::string();
}

Value fn_concat(const Invocation& inv, Args& args) {
  std::string out;
  for (size_t i = 1; i < args.size(); ++i) out += str(inv, args, i);
  return out;
}

Value fn_starts_with(const Invocation& inv, Args& args) {
  std::string haystack = str(inv, args, 1);
  std::string prefix = str(inv, args, 2);
  return haystack.compare(0, prefix.size(), prefix) == 0;
}

Value fn_contains(const Invocation& inv, Args& args) {
  return str(inv, args, 1).find(str(inv, args, 2)) != std::string::npos;
}

Value fn_substring_before(const Invocation& inv, Args& args) {
  std::string haystack = str(inv, args, 1);
  size_t pos = haystack.find(str(inv, args, 2));
  return pos == std::string::npos ? std::string() : haystack.substr(0, pos);
}

Value fn_substring_after(const Invocation& inv, Args& args) {
  std::string haystack = str(inv, args, 1);
  std::string needle = str(inv, args, 2);
  size_t pos = haystack.find(needle);
  return pos == std::string::npos ? std::string() : haystack.substr(pos + needle.size());
}

/// Implements substring(s, start[, length]) over code points with XPath rounding.
/// MUST keep characters at positions p with round(start) <= p < round(start) + round(length).
/// Inputs are context/args; outputs are strings.
Value fn_substring(const Invocation& inv, Args& args) {
  std::vector<std::string> chars = util::utf8_split(str(inv, args, 1));
  double start = xpath_round(num(inv, args, 2));
  double end = args.size() > 3 ? start + xpath_round(num(inv, args, 3)) : std::numeric_limits<double>::infinity();
  std::string out;
  for (size_t i = 0; i < chars.size(); ++i) {
    double position = static_cast<double>(i + 1);
    if (position >= start && position < end) out += chars[i];
  }
  return out;
}

Value fn_string_length(const Invocation& inv, Args& args) {
  std::string text = args.size() < 2 ? str(inv, args, 0) : str(inv, args, 1);
  return static_cast<double>(util::utf8_length(text));
}

Value fn_normalize_space(const Invocation& inv, Args& args) {
  std::string text = args.size() < 2 ? str(inv, args, 0) : str(inv, args, 1);
  std::string out;
  bool pending_space = false;
  for (char c : text) {
    if (util::is_xml_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

Value fn_translate(const Invocation& inv, Args& args) {
  std::vector<std::string> source = util::utf8_split(str(inv, args, 1));
  std::vector<std::string> from = util::utf8_split(str(inv, args, 2));
  std::vector<std::string> to = util::utf8_split(str(inv, args, 3));
  std::string out;
  for (const auto& ch : source) {
    auto it = std::find(from.begin(), from.end(), ch);
    if (it == from.end()) {
      out += ch;
      continue;
    }
    size_t index = static_cast<size_t>(it - from.begin());
    if (index < to.size()) out += to[index];
  }
  return out;
}

Value fn_true(const Invocation&, Args&) {
  return true;
}

Value fn_false(const Invocation&, Args&) {
  return false;
}

/// Tests the nearest xml:lang in scope against a language tag.
/// MUST match case-insensitively, exactly or as a prefix followed by '-'.
/// Inputs are context/lang; outputs are booleans.
Value fn_lang(const Invocation& inv, Args& args) {
  std::string wanted = util::to_lower(str(inv, args, 1));
  std::optional<int64_t> cur = expect_node(args.at(0), "lang()");
  while (cur.has_value()) {
    const XmlNode& node = node_at(inv.doc, *cur);
    if (node.kind == NodeKind::Element) {
      auto lang = attribute_value(inv.doc, node.id, "xml:lang");
      if (lang.has_value()) {
        std::string actual = util::to_lower(*lang);
        if (actual == wanted) return true;
        return actual.size() > wanted.size() && actual.compare(0, wanted.size(), wanted) == 0 &&
               actual[wanted.size()] == '-';
      }
    }
    cur = node.parent_id;
  }
  return false;
}

Value fn_sum(const Invocation& inv, Args& args) {
  double total = 0;
  for (int64_t id : expect_node_set(args.at(1), "sum()")) {
    total += conversion::parse_number(string_value(inv.doc, id));
  }
  return total;
}

Value fn_floor(const Invocation& inv, Args& args) {
  return std::floor(num(inv, args, 1));
}

Value fn_ceiling(const Invocation& inv, Args& args) {
  return std::ceil(num(inv, args, 1));
}

Value fn_round(const Invocation& inv, Args& args) {
  return xpath_round(num(inv, args, 1));
}

}  // namespace

Intrinsic find_function(const std::string& name) {
  static const std::unordered_map<std::string, Intrinsic> kFunctions = {
      {"fn:count", fn_count},
      {"fn:id", fn_id},
      {"fn:local-name", fn_local_name},
      {"fn:namespace-uri", fn_namespace_uri},
      {"fn:name", fn_name},
      {"fn:concat", fn_concat},
      {"fn:starts-with", fn_starts_with},
      {"fn:contains", fn_contains},
      {"fn:substring-before", fn_substring_before},
      {"fn:substring-after", fn_substring_after},
      {"fn:substring", fn_substring},
      {"fn:string-length", fn_string_length},
      {"fn:normalize-space", fn_normalize_space},
      {"fn:translate", fn_translate},
      {"fn:true", fn_true},
      {"fn:false", fn_false},
      {"fn:lang", fn_lang},
      {"fn:sum", fn_sum},
      {"fn:floor", fn_floor},
      {"fn:ceiling", fn_ceiling},
      {"fn:round", fn_round},
  };
  auto it = kFunctions.find(name);
  return it == kFunctions.end() ? nullptr : it->second;
}

}  // namespace xpathq::runtime
