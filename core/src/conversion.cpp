#include "conversion.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <vector>

#include "util/string_util.h"

namespace xpathq::conversion {

namespace {

/// Checks the accepted number grammar: [+-]digits[.digits][(e|E)[+-]digits].
/// MUST require at least one mantissa digit and MUST reject hex and inf/nan words.
/// Inputs are trimmed strings; outputs are booleans.
bool is_number_syntax(const std::string& s) {
  size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
  size_t digits = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
    ++i;
    ++digits;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) return false;
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    size_t exp_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
      ++i;
      ++exp_digits;
    }
    if (exp_digits == 0) return false;
  }
  return i == s.size();
}

runtime::Value reduce_nodes(const runtime::Value& value, const XmlDocument& doc) {
  if (std::holds_alternative<runtime::NodeList>(value) ||
      std::holds_alternative<runtime::NodeRef>(value) ||
      std::holds_alternative<std::monostate>(value)) {
    return to_string(value, doc);
  }
  return value;
}

}  // namespace

std::string format_number(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  // WHY: -0 prints as 0 in XPath.
  if (value == 0) return "0";

  std::vector<char> buf(400);
  if (std::floor(value) == value) {
    std::snprintf(buf.data(), buf.size(), "%.0f", value);
    return buf.data();
  }

  int precision = 17;
  for (int p = 1; p <= 17; ++p) {
    std::snprintf(buf.data(), buf.size(), "%.*g", p, value);
    if (std::strtod(buf.data(), nullptr) == value) {
      precision = p;
      break;
    }
  }
  std::snprintf(buf.data(), buf.size(), "%.*e", precision - 1, value);
  const char* exp_mark = std::strchr(buf.data(), 'e');
  int exponent = exp_mark ? std::atoi(exp_mark + 1) : 0;
  int decimals = std::max(0, precision - 1 - exponent);
  std::snprintf(buf.data(), buf.size(), "%.*f", decimals, value);
  std::string out = buf.data();
  if (out.find('.') != std::string::npos) {
    while (!out.empty() && out.back() == '0') out.pop_back();
    if (!out.empty() && out.back() == '.') out.pop_back();
  }
  return out;
}

double parse_number(const std::string& text) {
  std::string trimmed = util::trim_ws(text);
  if (!is_number_syntax(trimmed)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return std::strtod(trimmed.c_str(), nullptr);
}

std::string first_node_text(const runtime::NodeList& nodes, const XmlDocument& doc) {
  if (nodes.empty()) return "";
  return string_value(doc, nodes.front());
}

std::string to_string(const runtime::Value& value, const XmlDocument& doc) {
  if (std::holds_alternative<std::monostate>(value)) return "";
  if (const bool* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
  if (const double* d = std::get_if<double>(&value)) return format_number(*d);
  if (const std::string* s = std::get_if<std::string>(&value)) return *s;
  if (const runtime::NodeRef* node = std::get_if<runtime::NodeRef>(&value)) {
    return string_value(doc, node->id);
  }
  return first_node_text(std::get<runtime::NodeList>(value), doc);
}

double to_number(const runtime::Value& value, const XmlDocument& doc) {
  if (const bool* b = std::get_if<bool>(&value)) return *b ? 1.0 : 0.0;
  if (const double* d = std::get_if<double>(&value)) return *d;
  if (std::holds_alternative<std::monostate>(value)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return parse_number(to_string(value, doc));
}

bool to_boolean(const runtime::Value& value, const XmlDocument&) {
  if (std::holds_alternative<std::monostate>(value)) return false;
  if (const bool* b = std::get_if<bool>(&value)) return *b;
  if (const double* d = std::get_if<double>(&value)) return !std::isnan(*d) && *d != 0;
  if (const std::string* s = std::get_if<std::string>(&value)) return !s->empty();
  if (std::holds_alternative<runtime::NodeRef>(value)) return true;
  return !std::get<runtime::NodeList>(value).empty();
}

std::pair<runtime::Value, runtime::Value> to_compatible_types(const runtime::Value& left,
                                                              const runtime::Value& right,
                                                              const XmlDocument& doc) {
  runtime::Value l = reduce_nodes(left, doc);
  runtime::Value r = reduce_nodes(right, doc);
  if (std::holds_alternative<double>(l) || std::holds_alternative<double>(r)) {
    return {to_number(l, doc), to_number(r, doc)};
  }
  if (std::holds_alternative<std::string>(l) || std::holds_alternative<std::string>(r)) {
    return {to_string(l, doc), to_string(r, doc)};
  }
  return {to_boolean(l, doc), to_boolean(r, doc)};
}

}  // namespace xpathq::conversion
