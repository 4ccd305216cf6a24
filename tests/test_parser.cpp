#include "test_harness.h"

#include "query_parser.h"

namespace {

std::string sexpr(const std::string& expression) {
  xpathq::ParseResult result = xpathq::parse_expression(expression);
  if (result.error.has_value()) return "error: " + result.error->message;
  return xpathq::ast_to_sexpr(*result.ast);
}

void test_operator_precedence() {
  expect_true(sexpr("1 + 2 * 3") == "(plus (number 1) (star (number 2) (number 3)))", "star binds tighter");
  expect_true(sexpr("1 = 1 or 2 < 1 and 3") ==
                  "(or (eq (number 1) (number 1)) (and (lt (number 2) (number 1)) (number 3)))",
              "and binds tighter than or");
  expect_true(sexpr("-2 mod 3") == "(mod (negate (number 2)) (number 3))", "unary minus binds tightest");
}

void test_left_associative_binaries() {
  expect_true(sexpr("8 - 4 - 2") == "(minus (minus (number 8) (number 4)) (number 2))", "minus");
  expect_true(sexpr("8 div 4 div 2") == "(div (div (number 8) (number 4)) (number 2))", "div");
}

void test_absolute_and_abbreviated_paths() {
  expect_true(sexpr("/") == "(absolute_path)", "root only");
  expect_true(sexpr("/a") == "(absolute_path (axis \"child\" (test \"\" \"a\")))", "absolute child");
  expect_true(sexpr("//b") ==
                  "(absolute_path (axis \"descendant-or-self\" (node_type \"node\")) "
                  "(axis \"child\" (test \"\" \"b\")))",
              "double slash expands");
  expect_true(sexpr("..") == "(relative_path (axis \"parent\" (node_type \"node\")))", "parent abbreviation");
  expect_true(sexpr(".") == "(relative_path (axis \"self\" (node_type \"node\")))", "self abbreviation");
  expect_true(sexpr("@id") == "(relative_path (axis \"attribute\" (test \"\" \"id\")))", "attribute abbreviation");
}

void test_node_tests() {
  expect_true(sexpr("a:*") == "(relative_path (axis \"child\" (test \"a\" \"*\")))", "prefix wildcard");
  expect_true(sexpr("x:item") == "(relative_path (axis \"child\" (test \"x\" \"item\")))", "prefixed name");
  expect_true(sexpr("*") == "(relative_path (axis \"child\" (wildcard)))", "wildcard");
  expect_true(sexpr("processing-instruction('xml-stylesheet')") ==
                  "(relative_path (axis \"child\" (node_type \"processing-instruction\" "
                  "(string \"xml-stylesheet\"))))",
              "pi with target");
  expect_true(sexpr("text()") == "(relative_path (axis \"child\" (node_type \"text\")))", "text()");
}

void test_keywords_as_element_names() {
  expect_true(sexpr("div") == "(relative_path (axis \"child\" (test \"\" \"div\")))", "div as a name");
  expect_true(sexpr("div div div") ==
                  "(div (relative_path (axis \"child\" (test \"\" \"div\"))) "
                  "(relative_path (axis \"child\" (test \"\" \"div\"))))",
              "div operator between div steps");
  expect_true(sexpr("text") == "(relative_path (axis \"child\" (test \"\" \"text\")))", "text as a name");
}

void test_predicates_and_filters() {
  expect_true(sexpr("book[@id][1]") ==
                  "(relative_path (axis \"child\" (test \"\" \"book\") "
                  "(predicate (relative_path (axis \"attribute\" (test \"\" \"id\")))) "
                  "(predicate (number 1))))",
              "stacked predicates");
  expect_true(sexpr("$x[1]/a") ==
                  "(path (filter (variable \"x\") (predicate (number 1))) "
                  "(relative_path (axis \"child\" (test \"\" \"a\"))))",
              "filter then path");
  expect_true(sexpr("a | b") ==
                  "(union (relative_path (axis \"child\" (test \"\" \"a\"))) "
                  "(relative_path (axis \"child\" (test \"\" \"b\"))))",
              "union");
}

void test_function_calls() {
  expect_true(sexpr("concat('a', 'b', 'c')") ==
                  "(function \"concat\" (string \"a\") (string \"b\") (string \"c\"))",
              "variadic call");
  expect_true(sexpr("true()") == "(function \"true\")", "no-argument call");
}

void test_explicit_axes() {
  expect_true(sexpr("ancestor-or-self::node()") ==
                  "(relative_path (axis \"ancestor-or-self\" (node_type \"node\")))",
              "explicit axis");
  expect_true(sexpr("namespace::*") == "(relative_path (axis \"namespace\" (wildcard)))",
              "namespace axis still parses");
}

void test_syntax_errors() {
  auto result = xpathq::parse_expression("");
  expect_true(result.error.has_value() && result.error->message == "Empty expression", "empty");

  result = xpathq::parse_expression("/a[");
  expect_true(result.error.has_value(), "open predicate");
  expect_eq(result.error->position, 3, "error at end");

  result = xpathq::parse_expression("bogus::a");
  expect_true(result.error.has_value() && result.error->message == "Unknown axis 'bogus'", "unknown axis");

  result = xpathq::parse_expression("a b");
  expect_true(result.error.has_value() && result.error->token == "b", "trailing token");
  expect_eq(result.error->position, 2, "trailing token position");

  result = xpathq::parse_expression("concat('a");
  expect_true(result.error.has_value() && result.error->message == "Unterminated string literal",
              "unterminated literal");
  expect_eq(result.error->position, 7, "literal position");

  result = xpathq::parse_expression("a # b");
  expect_true(result.error.has_value() && result.error->message == "Unexpected character '#'",
              "bad character");
}

void test_parse_is_deterministic() {
  std::string expr = "//a[@x = 'y']/b[last()]";
  expect_true(sexpr(expr) == sexpr(expr), "same text same tree");
  expect_true(sexpr("//a [ 1 ]") == sexpr("//a[1]"), "whitespace is insignificant");
}

void test_nesting_limit() {
  const std::string deep = "Expression nested too deeply";
  expect_true(sexpr(std::string(200000, '-') + "1") == "error: " + deep, "long negation chain");
  expect_true(sexpr(std::string(100000, '(') + "1" + std::string(100000, ')')) == "error: " + deep,
              "deep parentheses");
  expect_true(sexpr("a" + std::string(100000, '[')).rfind("error: ", 0) == 0, "deep brackets fail");

  std::string sum = "1";
  for (int i = 0; i < 5000; ++i) sum += "+1";
  expect_true(sexpr(sum) == "error: " + deep, "long operator chain");

  std::string shallow = "1";
  for (int i = 0; i < 100; ++i) shallow = "(" + shallow + "+1)";
  expect_true(sexpr(shallow).rfind("error: ", 0) != 0, "moderate nesting parses");
  expect_true(sexpr("f(g(h(1)))[1]").rfind("error: ", 0) != 0, "nested calls parse");
}

}  // namespace

void register_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parser_operator_precedence", test_operator_precedence});
  tests.push_back({"parser_left_associative_binaries", test_left_associative_binaries});
  tests.push_back({"parser_absolute_and_abbreviated_paths", test_absolute_and_abbreviated_paths});
  tests.push_back({"parser_node_tests", test_node_tests});
  tests.push_back({"parser_keywords_as_element_names", test_keywords_as_element_names});
  tests.push_back({"parser_predicates_and_filters", test_predicates_and_filters});
  tests.push_back({"parser_function_calls", test_function_calls});
  tests.push_back({"parser_explicit_axes", test_explicit_axes});
  tests.push_back({"parser_syntax_errors", test_syntax_errors});
  tests.push_back({"parser_parse_is_deterministic", test_parse_is_deterministic});
  tests.push_back({"parser_nesting_limit", test_nesting_limit});
}
