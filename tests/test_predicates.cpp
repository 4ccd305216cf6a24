#include "test_harness.h"
#include "test_utils.h"

namespace {

const char* kLibrary =
    "<lib>"
    "<book id='b1'><t>A</t></book>"
    "<book><t>B</t></book>"
    "<book id='b3'><t>C</t></book>"
    "</lib>";

void test_attribute_existence() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "//book[@id]")) == "A,C", "books with id");
  expect_true(values_of(select(doc, "//book[@id][1]")) == "A", "position after filtering");
  expect_true(values_of(select(doc, "//book[@id][2]")) == "C", "second filtered book");
  expect_true(values_of(select(doc, "//book[string(@id)]")) == "A,C", "string predicate");
  expect_true(select(doc, "//book[false()]").empty(), "false predicate");
}

void test_positional_predicates() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "//book[1]")) == "A", "first book");
  expect_true(values_of(select(doc, "//book[2]")) == "B", "numeric position");
  expect_true(values_of(select(doc, "//book[1 + 1]")) == "B", "computed position");
  expect_true(values_of(select(doc, "//book[position() = 2]")) == "B", "position()");
  expect_true(values_of(select(doc, "//book[last()]")) == "C", "last()");
  expect_true(values_of(select(doc, "//book[position() < last()]")) == "A,B", "position against last");
  expect_true(select(doc, "//book[4]").empty(), "position out of range");
  expect_true(select(doc, "//book[1.5]").empty(), "fractional position matches nothing");
}

void test_value_predicates() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "//book[t = 'B']")) == "B", "child text equality");
  expect_true(values_of(select(doc, "//book[t[. = 'A']]")) == "A", "nested predicate");
  expect_true(values_of(select(doc, "//book[not(@id)]")) == "B", "negated existence");
  expect_true(values_of(select(doc, "//book[@id = 'b3' or t = 'A']")) == "A,C", "or predicate");
}

void test_reverse_axis_positions() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "//book[3]/preceding-sibling::book[1]")) == "B",
              "nearest preceding sibling first");
  expect_true(values_of(select(doc, "//book[3]/preceding-sibling::book[last()]")) == "A",
              "farthest preceding sibling last");
  expect_true(names_of(select(doc, "//t[. = 'C']/ancestor::*[1]")) == "book", "nearest ancestor");
  expect_true(names_of(select(doc, "//t[. = 'C']/ancestor::*[last()]")) == "lib", "farthest ancestor");
  expect_true(values_of(select(doc, "//book[1]/following-sibling::book[1]")) == "B",
              "forward axis counts from the context");
}

void test_filter_expressions() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "(//book)[last()]")) == "C", "filter last");
  expect_true(values_of(select(doc, "(//book[3]/preceding-sibling::book)[1]")) == "A",
              "filter positions follow document order");
  expect_true(values_of(select(doc, "(//book)[2]/t")) == "B", "path after filter");
  expect_true(values_of(select(doc, "(//t)[. != 'B']")) == "A,C", "filter by value");
  expect_true(throws<xpathq::NodeTypeError>([&]() { eval(doc, "(1)[1]"); }), "filter needs a node-set");
}

void test_unions() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(values_of(select(doc, "/lib/book[3] | /lib/book[1]")) == "A,C", "union in document order");
  expect_eq(select(doc, "/lib/book | //book").size(), 3, "union removes duplicates");
  expect_eq(select(doc, "//t | //book | /lib").size(), 7, "three-way union");
  expect_eq(select(doc, "//nothing | //book[1]").size(), 1, "union with an empty side");
  bool threw = false;
  try {
    eval(doc, "//book | 1");
  } catch (const xpathq::NodeTypeError& ex) {
    threw = true;
    expect_true(ex.node_type() == "number", "scalar type named");
  }
  expect_true(threw, "union with a scalar throws");
}

void test_top_level_focus() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  expect_true(eval_number(doc, "position()") == 1, "top-level position");
  expect_true(eval_number(doc, "last()") == 1, "top-level last");
  expect_true(eval_number(doc, "count(//book[@id])") == 2, "count with predicate");
}

void test_variables_in_predicates() {
  xpathq::XmlDocument doc = xpathq::parse_xml(kLibrary);
  xpathq::EvaluateOptions options;
  options.variables["want"] = std::string("b3");
  options.variables["n"] = 2.0;
  expect_true(values_of(select(doc, "//book[@id = $want]", 0, options)) == "C", "string variable");
  expect_true(values_of(select(doc, "//book[$n]", 0, options)) == "B", "numeric variable is a position");
}

}  // namespace

void register_predicate_tests(std::vector<TestCase>& tests) {
  tests.push_back({"predicates_attribute_existence", test_attribute_existence});
  tests.push_back({"predicates_positional", test_positional_predicates});
  tests.push_back({"predicates_value", test_value_predicates});
  tests.push_back({"predicates_reverse_axis_positions", test_reverse_axis_positions});
  tests.push_back({"predicates_filter_expressions", test_filter_expressions});
  tests.push_back({"predicates_unions", test_unions});
  tests.push_back({"predicates_top_level_focus", test_top_level_focus});
  tests.push_back({"predicates_variables", test_variables_in_predicates});
}
