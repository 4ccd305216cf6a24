#include "test_harness.h"
#include "test_utils.h"

#include <cmath>
#include <limits>

#include "conversion.h"

namespace {

using xpathq::runtime::NodeList;
using xpathq::runtime::Value;

void test_format_number() {
  using xpathq::conversion::format_number;
  expect_true(format_number(10) == "10", "integral");
  expect_true(format_number(-0.0) == "0", "negative zero");
  expect_true(format_number(0.5) == "0.5", "fraction");
  expect_true(format_number(-2.25) == "-2.25", "negative fraction");
  expect_true(format_number(0.1 + 0.2) == "0.30000000000000004", "shortest round trip");
  expect_true(format_number(1e21) == "1000000000000000000000", "no exponent");
  expect_true(format_number(std::numeric_limits<double>::quiet_NaN()) == "NaN", "nan");
  expect_true(format_number(std::numeric_limits<double>::infinity()) == "Infinity", "infinity");
  expect_true(format_number(-std::numeric_limits<double>::infinity()) == "-Infinity", "negative infinity");
}

void test_parse_number() {
  using xpathq::conversion::parse_number;
  expect_true(parse_number(" 42 ") == 42, "trimmed integer");
  expect_true(parse_number("-1.5") == -1.5, "negative fraction");
  expect_true(parse_number(".5") == 0.5, "leading dot");
  expect_true(parse_number("1.5e2") == 150, "exponent");
  expect_true(std::isnan(parse_number("")), "empty is NaN");
  expect_true(std::isnan(parse_number("abc")), "word is NaN");
  expect_true(std::isnan(parse_number("0x10")), "hex is NaN");
  expect_true(std::isnan(parse_number("1e")), "dangling exponent is NaN");
  expect_true(std::isnan(parse_number("inf")), "inf word is NaN");
  xpathq::XmlDocument doc = xpathq::make_document();
  double nan = xpathq::conversion::to_number(Value(std::string("abc")), doc);
  expect_true(xpathq::conversion::to_string(Value(nan), doc) == "NaN", "non-numeric string prints NaN");
}

void test_boolean_rules() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a>x</a></r>");
  using xpathq::conversion::to_boolean;
  expect_true(!to_boolean(Value(0.0), doc), "zero false");
  expect_true(!to_boolean(Value(std::numeric_limits<double>::quiet_NaN()), doc), "NaN false");
  expect_true(to_boolean(Value(-3.0), doc), "nonzero true");
  expect_true(!to_boolean(Value(std::string()), doc), "empty string false");
  expect_true(to_boolean(Value(std::string(" ")), doc), "whitespace string true");
  expect_true(to_boolean(Value(std::string("false")), doc), "nonempty string true");
  expect_true(!to_boolean(Value(NodeList{}), doc), "empty node-set false");
  expect_true(to_boolean(Value(NodeList{1}), doc), "nonempty node-set true");
  expect_true(!to_boolean(Value(), doc), "nil false");
}

void test_node_set_reduces_to_first_string() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a>7</a><a>8</a></r>");
  using namespace xpathq::conversion;
  NodeList as{2, 4};
  expect_true(to_string(Value(as), doc) == "7", "first node text");
  expect_true(to_number(Value(as), doc) == 7, "first node number");
  expect_true(to_string(Value(NodeList{}), doc).empty(), "empty set is empty string");
}

void test_compatible_types_priority() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a>1</a></r>");
  using xpathq::conversion::to_compatible_types;
  auto pair = to_compatible_types(Value(std::string("x")), Value(true), doc);
  expect_true(std::holds_alternative<std::string>(pair.second) && std::get<std::string>(pair.second) == "true",
              "string beats boolean");

  pair = to_compatible_types(Value(2.0), Value(true), doc);
  expect_true(std::holds_alternative<double>(pair.second) && std::get<double>(pair.second) == 1,
              "number beats boolean");

  pair = to_compatible_types(Value(false), Value(true), doc);
  expect_true(std::holds_alternative<bool>(pair.first) && !std::get<bool>(pair.first), "booleans stay boolean");

  pair = to_compatible_types(Value(std::string("2")), Value(2.0), doc);
  expect_true(std::holds_alternative<double>(pair.first) && std::get<double>(pair.first) == 2, "number beats string");

  pair = to_compatible_types(Value(NodeList{2}), Value(std::string("1")), doc);
  expect_true(std::holds_alternative<std::string>(pair.first) && std::get<std::string>(pair.first) == "1",
              "node-set becomes string");
}

void test_comparison_laws() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a>1</a><b>abc</b></r>");
  expect_true(eval_boolean(doc, "'1' = 1"), "string equals number");
  expect_true(!eval_boolean(doc, "'abc' = true()"), "boolean compared as string");
  expect_true(eval_boolean(doc, "'true' = true()"), "boolean string form");
  expect_true(!eval_boolean(doc, "2 = true()"), "boolean compared as number");
  expect_true(eval_boolean(doc, "1 = true()"), "true is one");
  expect_true(eval_boolean(doc, "/r/a = 1"), "node-set equals number");
  expect_true(eval_boolean(doc, "/r/b = 'abc'"), "node-set equals string");
  expect_true(!eval_boolean(doc, "/r/b = 1"), "non-numeric text is NaN");
  expect_true(eval_boolean(doc, "/r/b != 1"), "NaN is unequal");
  expect_true(!eval_boolean(doc, "/r/missing = false()"), "empty node-set compared as string");
  expect_true(eval_boolean(doc, "boolean(/r/missing) = false()"), "explicit boolean");
  xpathq::XmlDocument words = xpathq::parse_xml("<r><a>false</a></r>");
  expect_true(!eval_boolean(words, "/r/a = true()"), "node text compared as string");
  expect_true(eval_boolean(doc, "'10' > '9'"), "relational compares numbers");
  expect_true(!eval_boolean(doc, "'a' < 'b'"), "relational on words is NaN");
}

void test_public_conversions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a> 12 </a></r>");
  xpathq::QueryValue nodes = eval(doc, "/r/a");
  expect_true(xpathq::to_string(nodes) == " 12 ", "node string");
  expect_true(xpathq::to_number(nodes) == 12, "node number");
  expect_true(xpathq::to_boolean(nodes), "node boolean");
  expect_true(xpathq::to_string(xpathq::QueryValue(true)) == "true", "boolean string");
  expect_true(xpathq::to_number(xpathq::QueryValue(false)) == 0, "boolean number");
  expect_true(xpathq::to_string(xpathq::QueryValue(3.0)) == "3", "number string");
}

}  // namespace

void register_conversion_tests(std::vector<TestCase>& tests) {
  tests.push_back({"conversion_format_number", test_format_number});
  tests.push_back({"conversion_parse_number", test_parse_number});
  tests.push_back({"conversion_boolean_rules", test_boolean_rules});
  tests.push_back({"conversion_node_set_reduces_to_first_string", test_node_set_reduces_to_first_string});
  tests.push_back({"conversion_compatible_types_priority", test_compatible_types_priority});
  tests.push_back({"conversion_comparison_laws", test_comparison_laws});
  tests.push_back({"conversion_public_conversions", test_public_conversions});
}
