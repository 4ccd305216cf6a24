#include "test_harness.h"
#include "test_utils.h"

#include <cmath>

namespace {

void test_node_set_functions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><n>1</n><n>2.5</n><m>x</m></r>");
  expect_true(eval_number(doc, "count(/r/*)") == 3, "count");
  expect_true(eval_number(doc, "count(//none)") == 0, "count empty");
  expect_true(eval_number(doc, "sum(/r/n)") == 3.5, "sum");
  expect_true(std::isnan(eval_number(doc, "sum(/r/*)")), "sum with non-numeric text");
  expect_true(eval_number(doc, "sum(//none)") == 0, "sum of empty set");
  expect_true(throws<xpathq::NodeTypeError>([&]() { eval(doc, "count(1)"); }), "count needs a node-set");
  expect_true(throws<xpathq::NodeTypeError>([&]() { eval(doc, "sum('1')"); }), "sum needs a node-set");
}

void test_id_function() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a id='x'/><b id='y'/><c>y</c></r>");
  expect_true(names_of(select(doc, "id('y x')")) == "a,b", "whitespace-separated ids");
  expect_true(names_of(select(doc, "id(//c)")) == "b", "ids from node string-values");
  expect_true(select(doc, "id('nope')").empty(), "unknown id");
}

void test_name_functions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r xmlns:p='urn:p'><p:e/><plain a='1'/></r>");
  expect_true(eval_string(doc, "name(//p:e)") == "p:e", "name");
  expect_true(eval_string(doc, "local-name(//p:e)") == "e", "local-name");
  expect_true(eval_string(doc, "namespace-uri(//p:e)") == "urn:p", "namespace-uri");
  expect_true(eval_string(doc, "namespace-uri(//plain)").empty(), "no namespace");
  expect_true(eval_string(doc, "local-name(//missing)").empty(), "empty node-set");
  expect_true(eval_string(doc, "name(//@a)") == "a", "attribute name");
  expect_true(eval_string(doc, "name()").empty(), "document node has no name");
  expect_true(eval_string(doc, "name()", 2) == "p:e", "context node name");
  expect_true(eval_string(doc, "name(/r/*)") == "p:e", "first node in document order");
}

void test_string_functions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><v> 7 </v></r>");
  expect_true(eval_string(doc, "string(/r/v)") == " 7 ", "string of node");
  expect_true(eval_string(doc, "string()", 2) == " 7 ", "string of context");
  expect_true(eval_string(doc, "string(1 div 0)") == "Infinity", "string of infinity");
  expect_true(eval_string(doc, "concat('a', 'b', 1, true())") == "ab1true", "concat");
  expect_true(eval_boolean(doc, "starts-with('abc', 'ab')"), "starts-with");
  expect_true(!eval_boolean(doc, "starts-with('abc', 'bc')"), "starts-with negative");
  expect_true(eval_boolean(doc, "contains('abc', '')"), "contains empty");
  expect_true(eval_string(doc, "substring-before('1999/04/01', '/')") == "1999", "substring-before");
  expect_true(eval_string(doc, "substring-after('1999/04/01', '/')") == "04/01", "substring-after");
  expect_true(eval_string(doc, "substring-after('abc', 'x')").empty(), "substring-after miss");
  expect_true(eval_number(doc, "string-length('h\xC3\xA9llo')") == 5, "string-length counts code points");
  expect_true(eval_number(doc, "string-length()", 2) == 3, "string-length of context");
  expect_true(eval_string(doc, "normalize-space('  a \n b  ')") == "a b", "normalize-space");
  expect_true(eval_string(doc, "translate('bar', 'abc', 'ABC')") == "BAr", "translate");
  expect_true(eval_string(doc, "translate('--aaa--', 'abc-', 'ABC')") == "AAA", "translate removes");
}

void test_substring_rounding() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r/>");
  expect_true(eval_string(doc, "substring('12345', 2, 3)") == "234", "basic");
  expect_true(eval_string(doc, "substring('12345', 2)") == "2345", "open length");
  expect_true(eval_string(doc, "substring('12345', 1.5, 2.6)") == "234", "rounded bounds");
  expect_true(eval_string(doc, "substring('12345', 0, 3)") == "12", "start before first");
  expect_true(eval_string(doc, "substring('12345', 0 div 0, 3)").empty(), "NaN start");
  expect_true(eval_string(doc, "substring('12345', -42, 1 div 0)") == "12345", "infinite length");
  expect_true(eval_string(doc, "substring('12345', -1 div 0, 1 div 0)").empty(), "NaN end");
}

void test_boolean_functions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r xml:lang='en-US'><p/><q xml:lang='fr'/></r>");
  expect_true(eval_boolean(doc, "true()") && !eval_boolean(doc, "false()"), "constants");
  expect_true(!eval_boolean(doc, "boolean(//none)"), "boolean of empty set");
  expect_true(eval_boolean(doc, "not(0)"), "not");
  expect_eq(select(doc, "//p[lang('en')]").size(), 1, "lang prefix match");
  expect_eq(select(doc, "//p[lang('EN-us')]").size(), 1, "lang is case-insensitive");
  expect_true(select(doc, "//q[lang('en')]").empty(), "nearest xml:lang wins");
  expect_true(select(doc, "//p[lang('e')]").empty(), "lang needs a full subtag");
}

void test_number_functions() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r>42</r>");
  expect_true(eval_number(doc, "number()") == 42, "number of context");
  expect_true(eval_number(doc, "number(' 3 ')") == 3, "number trims");
  expect_true(std::isnan(eval_number(doc, "number('12abc')")), "number NaN");
  expect_true(eval_number(doc, "number(true())") == 1, "number of boolean");
  expect_true(eval_number(doc, "floor(-1.5)") == -2, "floor");
  expect_true(eval_number(doc, "ceiling(1.2)") == 2, "ceiling");
  expect_true(eval_number(doc, "round(2.5)") == 3, "round half up");
  expect_true(eval_number(doc, "round(-2.5)") == -2, "round half toward positive infinity");
  expect_true(std::isnan(eval_number(doc, "round(0 div 0)")), "round NaN");
  expect_true(eval_number(doc, "7 mod 3") == 1 && eval_number(doc, "-7 mod 3") == -1, "mod keeps sign");
  expect_true(eval_number(doc, "6 div 4") == 1.5, "div");
}

void test_function_errors() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r/>");
  bool threw = false;
  try {
    eval(doc, "foo()");
  } catch (const xpathq::FunctionError& ex) {
    threw = true;
    expect_true(std::string(ex.what()) == "Unknown function: foo()", "unknown message");
    expect_true(ex.function_name() == "foo", "unknown name");
    expect_eq(ex.argument_count(), 0, "unknown argc");
    expect_true(ex.step() == "foo()", "unknown step");
  }
  expect_true(threw, "unknown function throws");

  threw = false;
  try {
    eval(doc, "substring('x')");
  } catch (const xpathq::FunctionError& ex) {
    threw = true;
    expect_true(std::string(ex.what()) == "Function substring() expects 2 to 3 argument(s), got 1",
                "arity message");
    expect_eq(ex.argument_count(), 1, "arity argc");
  }
  expect_true(threw, "wrong arity throws");

  expect_true(throws<xpathq::FunctionError>([&]() { eval(doc, "concat('a')"); }), "concat minimum");
  expect_true(throws<xpathq::FunctionError>([&]() { eval(doc, "true(1)"); }), "true takes no arguments");
  expect_true(throws<xpathq::EvaluationError>([&]() { eval(doc, "last(1)"); }),
              "function errors are evaluation errors");
}

}  // namespace

void register_function_tests(std::vector<TestCase>& tests) {
  tests.push_back({"functions_node_set", test_node_set_functions});
  tests.push_back({"functions_id", test_id_function});
  tests.push_back({"functions_names", test_name_functions});
  tests.push_back({"functions_strings", test_string_functions});
  tests.push_back({"functions_substring_rounding", test_substring_rounding});
  tests.push_back({"functions_booleans", test_boolean_functions});
  tests.push_back({"functions_numbers", test_number_functions});
  tests.push_back({"functions_errors", test_function_errors});
}
