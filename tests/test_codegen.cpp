#include "test_harness.h"
#include "test_utils.h"

#include <stdexcept>

#include "compiler/compiler.h"
#include "generator/generator.h"
#include "query_parser.h"
#include "runtime/evaluation_context.h"

namespace {

using namespace xpathq::code;
using xpathq::CodePtr;
using xpathq::CodeType;

xpathq::AstPtr parsed(const std::string& expression) {
  xpathq::ParseResult result = xpathq::parse_expression(expression);
  expect_true(!result.error.has_value(), "parse " + expression);
  return result.ast;
}

xpathq::runtime::Value run_code(const CodePtr& code, const xpathq::XmlDocument& doc) {
  xpathq::runtime::EvaluationContext context;
  std::shared_ptr<const xpathq::LoadedQuery> loaded = context.load(*code);
  xpathq::VariableBindings variables;
  xpathq::runtime::Invocation inv{doc, variables};
  return xpathq::runtime::run(*loaded, inv, 0);
}

void test_compile_roots_at_context_block() {
  xpathq::Compiler compiler;
  CodePtr code = compiler.compile(*parsed("1 + 2"));
  expect_true(code->type == CodeType::Block, "root is a block");
  expect_true((code->params == std::vector<std::string>{"context"}), "block binds the context");
  expect_eq(code->children.size(), 1, "one body");
  expect_true(code->children[0]->type == CodeType::Call && code->children[0]->name == "add", "add call");
}

void test_node_results_are_sorted() {
  xpathq::Compiler compiler;
  CodePtr code = compiler.compile(*parsed("//a"));
  const xpathq::CodeNode& body = *code->children.at(0);
  expect_true(body.type == CodeType::Sequence, "node-set body is a sequence");
  const xpathq::CodeNode& last = *body.children.back();
  expect_true(last.type == CodeType::Call && last.name == "sort_unique", "ends with sort_unique");
}

void test_conversion_functions_lower_to_intrinsics() {
  xpathq::Compiler compiler;
  CodePtr code = compiler.compile(*parsed("not(boolean(1))"));
  const xpathq::CodeNode& body = *code->children.at(0);
  expect_true(body.type == CodeType::Not, "not() is a negation");
  const xpathq::CodeNode& inner = *body.children.at(0);
  expect_true(inner.type == CodeType::Call && inner.name == "to_boolean", "boolean() converts");

  code = compiler.compile(*parsed("string()"));
  const xpathq::CodeNode& str = *code->children.at(0);
  expect_true(str.type == CodeType::Call && str.name == "to_string", "string() converts");
  expect_true(str.children.at(0)->type == CodeType::Var && str.children.at(0)->name == "context",
              "string() reads the context node");

  std::string source = xpathq::render_source(*compiler.compile(*parsed("number('4') + 1")));
  expect_true(source.find("to_number(\"4\")") != std::string::npos, "number() rendered");

  xpathq::XmlDocument doc = xpathq::parse_xml("<r>5</r>");
  xpathq::runtime::Value value = run_code(compiler.compile(*parsed("number(/r) * 2")), doc);
  expect_true(std::get<double>(value) == 10, "number() runs");
}

void test_render_simple_source() {
  CodePtr code = block({"context"}, call("add", {number(1), number(2.5)}));
  expect_true(xpathq::render_source(*code) == "[](context) {\n  return add(1, 2.5);\n}\n", "rendered add");
}

void test_render_statements() {
  CodePtr code = block({"context"},
                       sequence({
                           assign("set", array()),
                           loop(call("children", {var("context")}), {"n", "i"},
                                if_then(and_(call("is_a", {var("n"), constant("Element")}),
                                             not_(call("present", {nil()}))),
                                        send(var("set"), "push", {var("n")}))),
                           call("sort_unique", {var("set")}),
                       }));
  std::string expected =
      "[](context) {\n"
      "  set = [];\n"
      "  each(children(context), [&](n, i) {\n"
      "    if ((is_a(n, NodeKind::Element) && !present(nil))) {\n"
      "      set.push(n);\n"
      "    }\n"
      "  });\n"
      "  return sort_unique(set);\n"
      "}\n";
  expect_true(xpathq::render_source(*code) == expected, "rendered statements");
}

void test_render_quotes_strings() {
  CodePtr code = block({"context"}, string("say \"hi\"\n"));
  expect_true(xpathq::render_source(*code) == "[](context) {\n  return \"say \\\"hi\\\"\\n\";\n}\n",
              "escaped literal");
  expect_true(throws<std::logic_error>([]() { xpathq::render_source(*number(1)); }), "root must be a block");
}

void test_loader_runs_code() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r><a/><b/><a/></r>");
  CodePtr count_as = block({"context"},
                           sequence({
                               assign("set", array()),
                               loop(call("descendants", {var("context")}), {"n"},
                                    if_then(call("name_equals_ci", {call("local_name", {var("n")}), string("a")}),
                                            send(var("set"), "push", {var("n")}))),
                               call("count", {var("set")}),
                           }));
  xpathq::runtime::Value value = run_code(count_as, doc);
  expect_true(std::holds_alternative<double>(value) && std::get<double>(value) == 2, "loop and push");

  xpathq::runtime::Value assigned = run_code(block({"context"}, assign("x", number(1))), doc);
  expect_true(std::holds_alternative<std::monostate>(assigned), "assignment evaluates to nil");

  xpathq::runtime::Value chosen =
      run_code(block({"context"}, if_then(boolean(false), string("yes"), string("no"))), doc);
  expect_true(std::get<std::string>(chosen) == "no", "else branch");
}

void test_loader_rejects_unknown_names() {
  xpathq::XmlDocument doc = xpathq::parse_xml("<r/>");
  bool threw = false;
  try {
    run_code(block({"context"}, call("bogus", {var("context")})), doc);
  } catch (const xpathq::EvaluationError& ex) {
    threw = true;
    expect_true(std::string(ex.what()) == "Unknown intrinsic: bogus", "intrinsic message");
  }
  expect_true(threw, "unknown intrinsic throws");
  expect_true(throws<xpathq::EvaluationError>([&]() { run_code(block({"context"}, constant("Nope")), doc); }),
              "unknown constant");
  expect_true(throws<xpathq::EvaluationError>([&]() { run_code(number(1), doc); }), "root must be a block");
  expect_true(throws<xpathq::EvaluationError>(
                  [&]() { run_code(block({"context"}, send(number(1), "push", {var("context")})), doc); }),
              "receiver must be a variable");
}

void test_missing_lowering_rule_is_a_defect() {
  xpathq::AstPtr path = parsed("a");
  const xpathq::AstNode& test = *path->children.at(0)->children.at(0);
  xpathq::Compiler compiler;
  expect_true(throws<std::logic_error>([&]() { compiler.compile(test); }), "node test alone has no rule");
}

void test_namespace_map_changes_code() {
  xpathq::AstPtr ast = parsed("/x:a");
  xpathq::Compiler unmapped;
  xpathq::Compiler mapped(xpathq::NamespaceMap{{"x", "urn:x"}});
  std::string plain = xpathq::render_source(*unmapped.compile(*ast));
  std::string bound = xpathq::render_source(*mapped.compile(*ast));
  expect_true(plain.find("namespace_prefix(") != std::string::npos, "unmapped compares prefix");
  expect_true(bound.find("namespace_uri(") != std::string::npos, "mapped compares uri");
  expect_true(plain != bound, "different code per namespace map");
}

}  // namespace

void register_codegen_tests(std::vector<TestCase>& tests) {
  tests.push_back({"codegen_compile_roots_at_context_block", test_compile_roots_at_context_block});
  tests.push_back({"codegen_node_results_are_sorted", test_node_results_are_sorted});
  tests.push_back({"codegen_conversion_functions_lower_to_intrinsics", test_conversion_functions_lower_to_intrinsics});
  tests.push_back({"codegen_render_simple_source", test_render_simple_source});
  tests.push_back({"codegen_render_statements", test_render_statements});
  tests.push_back({"codegen_render_quotes_strings", test_render_quotes_strings});
  tests.push_back({"codegen_loader_runs_code", test_loader_runs_code});
  tests.push_back({"codegen_loader_rejects_unknown_names", test_loader_rejects_unknown_names});
  tests.push_back({"codegen_missing_lowering_rule_is_a_defect", test_missing_lowering_rule_is_a_defect});
  tests.push_back({"codegen_namespace_map_changes_code", test_namespace_map_changes_code});
}
